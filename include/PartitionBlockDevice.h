#ifndef PARTITION_BLOCK_DEVICE_H
#define PARTITION_BLOCK_DEVICE_H

#include <cstdint>

#include "BlockDevice.h"

namespace fatVolume {

// PartitionBlockDevice
// --------------------
// Exposes the window [startLba, startLba + sectorCount) of another device as
// a device of its own, so a volume that begins at a known partition offset
// (such as the 8192-sector aligned partitions of SD cards) can be mounted
// directly. LBAs outside the window fail with IoError.
//
// The parent device is borrowed and must outlive this view.
class PartitionBlockDevice : public BlockDevice {
public:
  // The window is clipped to the end of the parent.
  PartitionBlockDevice(BlockDevice& parent, uint32_t startLba,
                       uint32_t sectorCount);

  // Everything from startLba to the end of the parent.
  PartitionBlockDevice(BlockDevice& parent, uint32_t startLba);

  FatVolumeResult readSector(uint32_t lba, SectorSpan out) override;
  FatVolumeResult writeSector(uint32_t lba, ConstSectorSpan data) override;
  uint32_t sectorCount() const override { return sectorCount_; }

  uint32_t startLba() const { return startLba_; }

private:
  BlockDevice* parent_;
  uint32_t startLba_;
  uint32_t sectorCount_;
};

}  // namespace fatVolume

#endif  // PARTITION_BLOCK_DEVICE_H
