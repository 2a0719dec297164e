#include "ImageBlockDevice.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <cstdio>
#include <limits>
#include <print>
#include <utility>

namespace fatVolume {

// -----------------------------------------------------------------------------
// Factory & Lifetime
// -----------------------------------------------------------------------------

ImageBlockDevice::ImageBlockDevice(int fd, uint32_t sectorCount)
    : fd_(fd), sectorCount_(sectorCount) {}

std::expected<ImageBlockDevice, FatVolumeResult> ImageBlockDevice::open(
    const std::string& path, bool writable) {
  int fd = ::open(path.c_str(), writable ? O_RDWR : O_RDONLY);
  if (fd < 0) {
    std::println(stderr, "[FatVolume] Cannot open '{}' (errno {})", path,
                 errno);
    return std::unexpected(FatVolumeResult::IoError);
  }

  // SEEK_END works for regular files and block device nodes alike, where
  // fstat() would report a size of zero for the latter.
  off_t size = lseek(fd, 0, SEEK_END);
  if (size == -1) {
    std::println(stderr, "[FatVolume] Cannot size '{}' (errno {})", path,
                 errno);
    close(fd);
    return std::unexpected(FatVolumeResult::IoError);
  }

  uint64_t sectors = static_cast<uint64_t>(size) / kSectorSize;
  if (sectors > std::numeric_limits<uint32_t>::max()) {
    sectors = std::numeric_limits<uint32_t>::max();
  }
  return ImageBlockDevice(fd, static_cast<uint32_t>(sectors));
}

ImageBlockDevice::ImageBlockDevice(ImageBlockDevice&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      sectorCount_(std::exchange(other.sectorCount_, 0)) {}

ImageBlockDevice& ImageBlockDevice::operator=(
    ImageBlockDevice&& other) noexcept {
  if (this != &other) {
    if (fd_ >= 0) {
      close(fd_);
    }
    fd_ = std::exchange(other.fd_, -1);
    sectorCount_ = std::exchange(other.sectorCount_, 0);
  }
  return *this;
}

ImageBlockDevice::~ImageBlockDevice() {
  if (fd_ >= 0) {
    close(fd_);
  }
}

// -----------------------------------------------------------------------------
// Sector I/O
// -----------------------------------------------------------------------------

FatVolumeResult ImageBlockDevice::readSector(uint32_t lba, SectorSpan out) {
  if (fd_ < 0 || lba >= sectorCount_) {
    return FatVolumeResult::IoError;
  }
  if (lseek(fd_, static_cast<off_t>(lba) * kSectorSize, SEEK_SET) == -1) {
    return FatVolumeResult::IoError;
  }

  std::byte* ptr = out.data();
  size_t remaining = out.size();
  while (remaining > 0) {
    ssize_t got = read(fd_, ptr, remaining);
    if (got == -1) {
      if (errno == EINTR) {
        continue;
      }
      return FatVolumeResult::IoError;
    }
    if (got == 0) {
      return FatVolumeResult::IoError;  // Unexpected end of file
    }
    ptr += got;
    remaining -= static_cast<size_t>(got);
  }
  return FatVolumeResult::Success;
}

FatVolumeResult ImageBlockDevice::writeSector(uint32_t lba,
                                              ConstSectorSpan data) {
  if (fd_ < 0 || lba >= sectorCount_) {
    return FatVolumeResult::IoError;
  }
  if (lseek(fd_, static_cast<off_t>(lba) * kSectorSize, SEEK_SET) == -1) {
    return FatVolumeResult::IoError;
  }

  const std::byte* ptr = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t written = write(fd_, ptr, remaining);
    if (written == -1) {
      if (errno == EINTR) {
        continue;
      }
      return FatVolumeResult::IoError;
    }
    ptr += written;
    remaining -= static_cast<size_t>(written);
  }
  return FatVolumeResult::Success;
}

}  // namespace fatVolume
