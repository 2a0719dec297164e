#include "BootSector.h"

#include <algorithm>

#include "LittleEndian.h"

namespace fatVolume {

// -----------------------------------------------------------------------------
// Field Offsets
// -----------------------------------------------------------------------------

static constexpr size_t kJmpBootOffset = 0x000;
static constexpr size_t kOemNameOffset = 0x003;
static constexpr size_t kBytesPerSectorOffset = 0x00B;
static constexpr size_t kSectorsPerClusterOffset = 0x00D;
static constexpr size_t kReservedSectorCountOffset = 0x00E;
static constexpr size_t kFatCountOffset = 0x010;
static constexpr size_t kRootEntryCountOffset = 0x011;
static constexpr size_t kTotalSectors16Offset = 0x013;
static constexpr size_t kMediaDescriptorOffset = 0x015;
static constexpr size_t kFatSize16Offset = 0x016;
static constexpr size_t kSectorsPerTrackOffset = 0x018;
static constexpr size_t kHeadCountOffset = 0x01A;
static constexpr size_t kHiddenSectorsOffset = 0x01C;
static constexpr size_t kTotalSectors32Offset = 0x020;
static constexpr size_t kFatSize32Offset = 0x024;
static constexpr size_t kExtFlagsOffset = 0x028;
static constexpr size_t kFsVersionOffset = 0x02A;
static constexpr size_t kRootClusterOffset = 0x02C;
static constexpr size_t kFsInfoSectorOffset = 0x030;
static constexpr size_t kBackupBootSectorOffset = 0x032;
static constexpr size_t kDriveNumberOffset = 0x040;
static constexpr size_t kBootSignatureOffset = 0x042;
static constexpr size_t kVolumeIdOffset = 0x043;
static constexpr size_t kVolumeLabelOffset = 0x047;
static constexpr size_t kFsTypeOffset = 0x052;
static constexpr size_t kSignatureOffset = 0x1FE;

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

template <typename T, size_t N>
static std::array<T, N> readArray(BlockDevice::ConstSectorSpan sector,
                                  size_t offset) {
  std::array<T, N> result;
  std::transform(sector.begin() + offset, sector.begin() + offset + N,
                 result.begin(),
                 [](std::byte b) { return static_cast<T>(b); });
  return result;
}

static uint8_t readU8(BlockDevice::ConstSectorSpan sector, size_t offset) {
  return std::to_integer<uint8_t>(sector[offset]);
}

// -----------------------------------------------------------------------------
// Decoder
// -----------------------------------------------------------------------------

std::expected<BootSector, FatVolumeResult> decodeBootSector(
    BlockDevice::ConstSectorSpan sector) {
  // Both rejections are checked before any other field is looked at.
  const uint16_t signature = readLe16(sector, kSignatureOffset);
  if (signature != kBootSignature) {
    return std::unexpected(FatVolumeResult::InvalidFat32Structure);
  }

  const uint16_t bytesPerSector = readLe16(sector, kBytesPerSectorOffset);
  if (bytesPerSector != kSupportedBytesPerSector) {
    return std::unexpected(FatVolumeResult::InvalidFat32Structure);
  }

  return BootSector{
      .jmpBoot = readArray<uint8_t, 3>(sector, kJmpBootOffset),
      .oemName = readArray<char, 8>(sector, kOemNameOffset),
      .bytesPerSector = bytesPerSector,
      .sectorsPerCluster = readU8(sector, kSectorsPerClusterOffset),
      .reservedSectorCount = readLe16(sector, kReservedSectorCountOffset),
      .fatCount = readU8(sector, kFatCountOffset),
      .rootEntryCount = readLe16(sector, kRootEntryCountOffset),
      .totalSectors16 = readLe16(sector, kTotalSectors16Offset),
      .mediaDescriptor = readU8(sector, kMediaDescriptorOffset),
      .fatSize16 = readLe16(sector, kFatSize16Offset),
      .sectorsPerTrack = readLe16(sector, kSectorsPerTrackOffset),
      .headCount = readLe16(sector, kHeadCountOffset),
      .hiddenSectors = readLe32(sector, kHiddenSectorsOffset),
      .totalSectors32 = readLe32(sector, kTotalSectors32Offset),
      .fatSize32 = readLe32(sector, kFatSize32Offset),
      .extFlags = readLe16(sector, kExtFlagsOffset),
      .fsVersion = readLe16(sector, kFsVersionOffset),
      .rootCluster = readLe32(sector, kRootClusterOffset),
      .fsInfoSector = readLe16(sector, kFsInfoSectorOffset),
      .backupBootSector = readLe16(sector, kBackupBootSectorOffset),
      .driveNumber = readU8(sector, kDriveNumberOffset),
      .bootSignature = readU8(sector, kBootSignatureOffset),
      .volumeId = readLe32(sector, kVolumeIdOffset),
      .volumeLabel = readArray<char, 11>(sector, kVolumeLabelOffset),
      .fsType = readArray<char, 8>(sector, kFsTypeOffset),
      .signature = signature,
  };
}

}  // namespace fatVolume
