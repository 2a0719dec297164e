#ifndef BLOCK_DEVICE_H
#define BLOCK_DEVICE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "FatVolumeResult.h"

namespace fatVolume {

// BlockDevice
// -----------
// The sector-level capability a mounted volume consumes. Implementations
// (image files, memory, a real medium) live outside the volume core.
//
// Sectors are always kSectorSize bytes. A read or write that cannot be
// satisfied (failed medium, LBA past the end) returns IoError; any retry
// policy belongs to the implementation, never to the caller of this class.
class BlockDevice {
public:
  static constexpr uint32_t kSectorSize = 512;

  using Sector = std::array<std::byte, kSectorSize>;
  using SectorSpan = std::span<std::byte, kSectorSize>;
  using ConstSectorSpan = std::span<const std::byte, kSectorSize>;

  virtual ~BlockDevice() = default;

  virtual FatVolumeResult readSector(uint32_t lba, SectorSpan out) = 0;
  virtual FatVolumeResult writeSector(uint32_t lba, ConstSectorSpan data) = 0;
  virtual uint32_t sectorCount() const = 0;
};

}  // namespace fatVolume

#endif  // BLOCK_DEVICE_H
