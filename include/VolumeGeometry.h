// =============================================================================
// VolumeGeometry.h
// =============================================================================
//
// FAT32 layout derived from the boot sector, and FAT entry lookup against it.
//
// The lookup functions take the device and the geometry by themselves rather
// than a Volume, so a ClusterChain can carry its own copy of both.
//
// =============================================================================

#ifndef VOLUME_GEOMETRY_H
#define VOLUME_GEOMETRY_H

#include <cstdint>
#include <expected>

#include "BlockDevice.h"
#include "BootSector.h"
#include "FatVolumeResult.h"

namespace fatVolume {

// -----------------------------------------------------------------------------
// FAT Entry Values
// -----------------------------------------------------------------------------

// Only the low 28 bits of a FAT32 entry are significant.
inline constexpr uint32_t kFatEntryMask = 0x0FFFFFFF;

inline constexpr uint32_t kFatFreeCluster = 0x00000000;
inline constexpr uint32_t kFatReservedCluster = 0x00000001;
inline constexpr uint32_t kFatBadCluster = 0x0FFFFFF7;
inline constexpr uint32_t kFatEndOfChainMin = 0x0FFFFFF8;
inline constexpr uint32_t kFatEndOfChainMax = 0x0FFFFFFF;

// Clusters 0 and 1 are never data clusters.
inline constexpr uint32_t kFirstDataCluster = 2;

inline constexpr uint32_t kFatEntrySize = 4;

inline constexpr bool isEndOfChain(uint32_t entry) {
  return entry >= kFatEndOfChainMin && entry <= kFatEndOfChainMax;
}

// -----------------------------------------------------------------------------
// VolumeGeometry
// -----------------------------------------------------------------------------
//
// Derived once from the boot sector at mount time and immutable afterwards.
//
//   firstFatSector  = reservedSectorCount
//   firstDataSector = reservedSectorCount + fatCount * fatSize
//   clusterCount    = (totalSectors - firstDataSector) / sectorsPerCluster
//
// Each FAT copy holds fatSize * bytesPerSector / 4 entries, which must cover
// clusters 0 .. clusterCount + 1.
struct VolumeGeometry {
  uint32_t bytesPerSector;
  uint32_t sectorsPerCluster;
  uint32_t reservedSectorCount;
  uint32_t fatCount;
  uint32_t fatSize;
  uint32_t rootCluster;
  uint32_t totalSectors;
  uint32_t firstFatSector;
  uint32_t firstDataSector;
  uint32_t clusterCount;

  // Fails with InvalidFat32Structure when sectorsPerCluster, fatCount or
  // fatSize32 is zero, when the FAT region ends beyond the 32-bit sector
  // range, when totalSectors32 is smaller than firstDataSector, or when one
  // FAT copy is too small to hold an entry for every cluster.
  static std::expected<VolumeGeometry, FatVolumeResult> fromBootSector(
      const BootSector& bootSector);

  // True for clusters 2 .. clusterCount + 1.
  bool isDataCluster(uint32_t cluster) const;
};

// -----------------------------------------------------------------------------
// FAT Table Access
// -----------------------------------------------------------------------------

// Reads the unmasked entry for any cluster index from the first FAT copy.
// No range check. IoError when the device read fails.
std::expected<uint32_t, FatVolumeResult> readRawFatEntry(
    BlockDevice& device, const VolumeGeometry& geometry, uint32_t cluster);

// Range-checked, masked lookup of a data cluster's entry.
std::expected<uint32_t, FatVolumeResult> readFatEntry(
    BlockDevice& device, const VolumeGeometry& geometry, uint32_t cluster);

}  // namespace fatVolume

#endif  // VOLUME_GEOMETRY_H
