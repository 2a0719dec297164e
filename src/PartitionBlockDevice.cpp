#include "PartitionBlockDevice.h"

#include <algorithm>

namespace fatVolume {

static uint32_t clippedCount(const BlockDevice& parent, uint32_t startLba,
                             uint32_t sectorCount) {
  uint32_t parentSectors = parent.sectorCount();
  if (startLba >= parentSectors) {
    return 0;
  }
  return std::min(sectorCount, parentSectors - startLba);
}

PartitionBlockDevice::PartitionBlockDevice(BlockDevice& parent,
                                           uint32_t startLba,
                                           uint32_t sectorCount)
    : parent_(&parent),
      startLba_(startLba),
      sectorCount_(clippedCount(parent, startLba, sectorCount)) {}

PartitionBlockDevice::PartitionBlockDevice(BlockDevice& parent,
                                           uint32_t startLba)
    : PartitionBlockDevice(parent, startLba, parent.sectorCount()) {}

FatVolumeResult PartitionBlockDevice::readSector(uint32_t lba,
                                                 SectorSpan out) {
  if (lba >= sectorCount_) {
    return FatVolumeResult::IoError;
  }
  return parent_->readSector(startLba_ + lba, out);
}

FatVolumeResult PartitionBlockDevice::writeSector(uint32_t lba,
                                                  ConstSectorSpan data) {
  if (lba >= sectorCount_) {
    return FatVolumeResult::IoError;
  }
  return parent_->writeSector(startLba_ + lba, data);
}

}  // namespace fatVolume
