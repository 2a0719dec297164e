#ifndef MEMORY_BLOCK_DEVICE_H
#define MEMORY_BLOCK_DEVICE_H

#include <cstdint>
#include <optional>
#include <vector>

#include "BlockDevice.h"

namespace fatVolume {

// MemoryBlockDevice
// -----------------
// A zero-filled, in-memory BlockDevice. Used to build synthetic volumes and
// to observe how a Volume talks to its device: every read is counted, and a
// single LBA can be made to fail.
class MemoryBlockDevice : public BlockDevice {
public:
  explicit MemoryBlockDevice(uint32_t sectorCount);

  FatVolumeResult readSector(uint32_t lba, SectorSpan out) override;
  FatVolumeResult writeSector(uint32_t lba, ConstSectorSpan data) override;
  uint32_t sectorCount() const override {
    return static_cast<uint32_t>(sectors_.size());
  }

  // Direct access for setting up volume contents. lba must be in range.
  SectorSpan sector(uint32_t lba) { return sectors_.at(lba); }

  // Makes every subsequent read of lba fail with IoError.
  void failReadsAt(uint32_t lba) { failingLba_ = lba; }
  void clearFailure() { failingLba_.reset(); }

  uint64_t readCount() const { return readCount_; }
  void resetReadCount() { readCount_ = 0; }

private:
  std::vector<Sector> sectors_;
  std::optional<uint32_t> failingLba_;
  uint64_t readCount_ = 0;
};

}  // namespace fatVolume

#endif  // MEMORY_BLOCK_DEVICE_H
