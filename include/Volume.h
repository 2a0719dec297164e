// =============================================================================
// Volume.h
// =============================================================================
//
// A mounted FAT32 volume: validated geometry plus read-only access to the File
// Allocation Table.
//
// On-disk regions, in sector order:
//
//   ┌────────────────────────────────────────────────────────────────────┐
//   │ 0 .. reservedSectorCount-1     Reserved region (boot sector,       │
//   │                                FSInfo, backup boot sector)         │
//   ├────────────────────────────────────────────────────────────────────┤
//   │ firstFatSector                 FAT #0, fatSize32 sectors           │
//   │  ...                           FAT #1 .. FAT #fatCount-1           │
//   ├────────────────────────────────────────────────────────────────────┤
//   │ firstDataSector                Cluster 2, then 3, 4, ...           │
//   │                                sectorsPerCluster sectors each      │
//   └────────────────────────────────────────────────────────────────────┘
//
// Entries are always read from the first FAT copy. Nothing read from the
// device is cached: every entry lookup reads its FAT sector again.
//
// A Volume is not thread safe. Callers sharing one across threads must
// serialize access themselves.
//
// =============================================================================

#ifndef VOLUME_H
#define VOLUME_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

#include "BlockDevice.h"
#include "BootSector.h"
#include "ClusterChain.h"
#include "FatVolumeResult.h"
#include "VolumeGeometry.h"

namespace fatVolume {

// -----------------------------------------------------------------------------
// FsInfo
// -----------------------------------------------------------------------------
//
// Advisory allocation hints from the FSInfo sector. The FAT specification
// says drivers must not trust these values; std::nullopt means the volume
// recorded "unknown" (0xFFFFFFFF).
struct FsInfo {
  std::optional<uint32_t> freeCount;
  std::optional<uint32_t> nextFree;
};

// -----------------------------------------------------------------------------
// VolumeFlags
// -----------------------------------------------------------------------------
//
// State bits kept in the high bits of FAT[1]:
//   bit 27 (0x08000000) set  = volume was unmounted cleanly
//   bit 26 (0x04000000) set  = no disk I/O errors were encountered
struct VolumeFlags {
  bool cleanShutdown;
  bool noHardErrors;
};

// -----------------------------------------------------------------------------
// Volume
// -----------------------------------------------------------------------------

class Volume {
public:
  // Factory. Reads sector 0 of the device, decodes and validates it, and
  // derives the geometry. Errors:
  //   IoError                 device reports zero sectors, or sector 0 read
  //                           failed
  //   InvalidFat32Structure   bad signature, bytesPerSector != 512, zero
  //                           sectorsPerCluster, fatCount or fatSize32, a
  //                           FAT too small for the cluster count, or
  //                           impossible sector counts
  //
  // The device is borrowed: it must outlive the returned Volume.
  static std::expected<Volume, FatVolumeResult> mount(BlockDevice& device);

  Volume(const Volume&) = delete;
  Volume& operator=(const Volume&) = delete;
  Volume(Volume&&) = default;
  Volume& operator=(Volume&&) = default;

  // Cluster Addressing
  uint32_t clusterToLba(uint32_t cluster) const;

  // FAT Table Access
  std::expected<uint32_t, FatVolumeResult> fatEntry(uint32_t cluster) const;
  ClusterChain walkChain(uint32_t startCluster) const;
  std::expected<std::vector<uint32_t>, FatVolumeResult> collectChain(
      uint32_t startCluster) const;

  // Metadata
  std::expected<FsInfo, FatVolumeResult> readFsInfo() const;
  std::expected<VolumeFlags, FatVolumeResult> readVolumeFlags() const;

  // Cluster Data
  FatVolumeResult readCluster(uint32_t cluster, std::span<std::byte> out) const;

  // Accessors
  const VolumeGeometry& geometry() const { return geometry_; }
  uint32_t rootCluster() const { return geometry_.rootCluster; }
  uint32_t bytesPerSector() const { return geometry_.bytesPerSector; }
  uint32_t sectorsPerCluster() const { return geometry_.sectorsPerCluster; }
  uint32_t bytesPerCluster() const {
    return geometry_.bytesPerSector * geometry_.sectorsPerCluster;
  }
  uint32_t clusterCount() const { return geometry_.clusterCount; }
  uint32_t volumeId() const { return volumeId_; }
  const std::array<char, 11>& volumeLabel() const { return volumeLabel_; }

private:
  Volume(BlockDevice& device, const VolumeGeometry& geometry,
         const BootSector& bootSector);

  BlockDevice* device_;
  VolumeGeometry geometry_;
  uint16_t fsInfoSector_;
  uint32_t volumeId_;
  std::array<char, 11> volumeLabel_;
};

}  // namespace fatVolume

#endif  // VOLUME_H
