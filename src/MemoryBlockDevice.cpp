#include "MemoryBlockDevice.h"

#include <algorithm>

namespace fatVolume {

MemoryBlockDevice::MemoryBlockDevice(uint32_t sectorCount)
    : sectors_(sectorCount, Sector{}) {}

FatVolumeResult MemoryBlockDevice::readSector(uint32_t lba, SectorSpan out) {
  readCount_++;
  if (lba >= sectors_.size() || failingLba_ == lba) {
    return FatVolumeResult::IoError;
  }
  std::ranges::copy(sectors_[lba], out.begin());
  return FatVolumeResult::Success;
}

FatVolumeResult MemoryBlockDevice::writeSector(uint32_t lba,
                                               ConstSectorSpan data) {
  if (lba >= sectors_.size()) {
    return FatVolumeResult::IoError;
  }
  std::ranges::copy(data, sectors_[lba].begin());
  return FatVolumeResult::Success;
}

}  // namespace fatVolume
