// =============================================================================
// BootSector.h
// =============================================================================
//
// Decoder for the FAT32 Volume Boot Record (sector 0 of the volume).
//
// The boot sector carries the BIOS Parameter Block (BPB), which describes the
// volume's geometry. Its layout is fixed by the Microsoft FAT specification
// and fields sit at unaligned offsets, so every field is read explicitly at
// its byte offset with little-endian decoding. Nothing here reinterprets the
// sector buffer as a packed struct.
//
// Boot sector layout (offsets in bytes):
//
//   0x000  jmpBoot[3]           0x024  fatSize32
//   0x003  oemName[8]           0x028  extFlags
//   0x00B  bytesPerSector       0x02A  fsVersion
//   0x00D  sectorsPerCluster    0x02C  rootCluster
//   0x00E  reservedSectorCount  0x030  fsInfoSector
//   0x010  fatCount             0x032  backupBootSector
//   0x011  rootEntryCount       0x034  reserved[12]
//   0x013  totalSectors16       0x040  driveNumber
//   0x015  mediaDescriptor      0x041  reserved1
//   0x016  fatSize16            0x042  bootSignature
//   0x018  sectorsPerTrack      0x043  volumeId
//   0x01A  headCount            0x047  volumeLabel[11]
//   0x01C  hiddenSectors        0x052  fsType[8]
//   0x020  totalSectors32       0x1FE  signature (0xAA55)
//
// =============================================================================

#ifndef BOOT_SECTOR_H
#define BOOT_SECTOR_H

#include <array>
#include <cstdint>
#include <expected>

#include "BlockDevice.h"
#include "FatVolumeResult.h"

namespace fatVolume {

// BootSector
// ----------
// Decoded copy of the boot sector fields. Reserved areas and the boot code
// are not carried: they are ignored, never reinterpreted.
struct BootSector {
  std::array<uint8_t, 3> jmpBoot;
  std::array<char, 8> oemName;

  // Common BPB (shared with FAT12/FAT16).
  uint16_t bytesPerSector;
  uint8_t sectorsPerCluster;
  uint16_t reservedSectorCount;
  uint8_t fatCount;
  uint16_t rootEntryCount;
  uint16_t totalSectors16;
  uint8_t mediaDescriptor;
  uint16_t fatSize16;
  uint16_t sectorsPerTrack;
  uint16_t headCount;
  uint32_t hiddenSectors;
  uint32_t totalSectors32;

  // FAT32 extended BPB.
  uint32_t fatSize32;
  uint16_t extFlags;
  uint16_t fsVersion;
  uint32_t rootCluster;
  uint16_t fsInfoSector;
  uint16_t backupBootSector;
  uint8_t driveNumber;
  uint8_t bootSignature;
  uint32_t volumeId;
  std::array<char, 11> volumeLabel;
  std::array<char, 8> fsType;

  uint16_t signature;
};

// The trailing signature, bytes 0x55 0xAA at offsets 510 and 511.
inline constexpr uint16_t kBootSignature = 0xAA55;

// The only sector size this library mounts.
inline constexpr uint16_t kSupportedBytesPerSector = BlockDevice::kSectorSize;

// decodeBootSector
// ----------------
// Decodes one full sector. The fixed-extent span makes a short buffer a
// compile-time error rather than something to check at runtime.
//
// Fails with InvalidFat32Structure when:
//   - the signature at 0x1FE is not 0xAA55
//   - bytesPerSector is not 512
//
// Pure: performs no I/O and does not log.
std::expected<BootSector, FatVolumeResult> decodeBootSector(
    BlockDevice::ConstSectorSpan sector);

}  // namespace fatVolume

#endif  // BOOT_SECTOR_H
