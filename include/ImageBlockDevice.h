#ifndef IMAGE_BLOCK_DEVICE_H
#define IMAGE_BLOCK_DEVICE_H

#include <cstdint>
#include <expected>
#include <string>

#include "BlockDevice.h"

namespace fatVolume {

// ImageBlockDevice
// ----------------
// A BlockDevice backed by a file descriptor: a disk image or a raw device
// node. The descriptor is owned and closed on destruction.
//
// The sector count is the file size divided by 512, capped at the 32-bit LBA
// range. A trailing partial sector is not addressable.
class ImageBlockDevice : public BlockDevice {
public:
  // Factory. Opens read-only unless writable is set; a read-only device
  // fails every writeSector() with IoError.
  static std::expected<ImageBlockDevice, FatVolumeResult> open(
      const std::string& path, bool writable = false);

  ImageBlockDevice(ImageBlockDevice&& other) noexcept;
  ImageBlockDevice& operator=(ImageBlockDevice&& other) noexcept;
  ImageBlockDevice(const ImageBlockDevice&) = delete;
  ImageBlockDevice& operator=(const ImageBlockDevice&) = delete;
  ~ImageBlockDevice() override;

  FatVolumeResult readSector(uint32_t lba, SectorSpan out) override;
  FatVolumeResult writeSector(uint32_t lba, ConstSectorSpan data) override;
  uint32_t sectorCount() const override { return sectorCount_; }

private:
  ImageBlockDevice(int fd, uint32_t sectorCount);

  int fd_;
  uint32_t sectorCount_;
};

}  // namespace fatVolume

#endif  // IMAGE_BLOCK_DEVICE_H
