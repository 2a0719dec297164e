// =============================================================================
// Volume.cpp
// =============================================================================
//
// Mount-time validation, geometry derivation, and FAT entry access.
//
// All sector arithmetic that can be driven by hostile boot sector values is
// done in 64 bits first and range-checked before being narrowed back to the
// 32-bit LBAs the block device understands.
//
// =============================================================================

#include "Volume.h"

#include <cstdio>
#include <print>
#include <string_view>

#include "LittleEndian.h"

namespace fatVolume {

// -----------------------------------------------------------------------------
// FSInfo Layout
// -----------------------------------------------------------------------------
//
// FSI_leadSignature   offset 0     "RRaA"
// FSI_structSignature offset 484   "rrAa"
// FSI_freeCount       offset 488
// FSI_nextFree        offset 492
// FSI_trailSignature  offset 508

static constexpr size_t kFsInfoLeadSignatureOffset = 0;
static constexpr size_t kFsInfoStructSignatureOffset = 484;
static constexpr size_t kFsInfoFreeCountOffset = 488;
static constexpr size_t kFsInfoNextFreeOffset = 492;
static constexpr size_t kFsInfoTrailSignatureOffset = 508;

static constexpr uint32_t kFsInfoLeadSignature = 0x41615252;
static constexpr uint32_t kFsInfoStructSignature = 0x61417272;
static constexpr uint32_t kFsInfoTrailSignature = 0xAA550000;
static constexpr uint32_t kFsInfoUnknown = 0xFFFFFFFF;

// BPB_fsInfoSector values meaning "this volume has no FSInfo sector".
static constexpr uint16_t kNoFsInfoSector = 0x0000;
static constexpr uint16_t kNoFsInfoSectorAlt = 0xFFFF;

// -----------------------------------------------------------------------------
// Volume State Flags (FAT[1])
// -----------------------------------------------------------------------------

static constexpr uint32_t kVolumeFlagsCluster = 1;
static constexpr uint32_t kCleanShutdownBit = 0x08000000;
static constexpr uint32_t kNoHardErrorsBit = 0x04000000;

static std::unexpected<FatVolumeResult> rejectMount(FatVolumeResult result,
                                                    std::string_view reason) {
  std::println(stderr, "[FatVolume] Mount failed: {} ({})", reason,
               toString(result));
  return std::unexpected(result);
}

// -----------------------------------------------------------------------------
// Factory & Constructor
// -----------------------------------------------------------------------------

Volume::Volume(BlockDevice& device, const VolumeGeometry& geometry,
               const BootSector& bootSector)
    : device_(&device),
      geometry_(geometry),
      fsInfoSector_(bootSector.fsInfoSector),
      volumeId_(bootSector.volumeId),
      volumeLabel_(bootSector.volumeLabel) {}

std::expected<Volume, FatVolumeResult> Volume::mount(BlockDevice& device) {
  const uint32_t deviceSectors = device.sectorCount();
  if (deviceSectors == 0) {
    return rejectMount(FatVolumeResult::IoError, "device reports no sectors");
  }

  BlockDevice::Sector sector{};
  if (device.readSector(0, sector) != FatVolumeResult::Success) {
    return rejectMount(FatVolumeResult::IoError, "cannot read boot sector");
  }

  auto bootSector = decodeBootSector(sector);
  if (!bootSector) {
    return rejectMount(bootSector.error(),
                       "bad boot signature or unsupported sector size");
  }

  auto geometry = VolumeGeometry::fromBootSector(*bootSector);
  if (!geometry) {
    return rejectMount(geometry.error(),
                       "inconsistent sector counts or FAT size");
  }

  if (geometry->totalSectors > deviceSectors) {
    std::println(
        "[FatVolume] Warning: volume declares {} sectors, device has {}",
        geometry->totalSectors, deviceSectors);
  }

  std::println(
      "[FatVolume] Mounted: {} clusters of {} sectors, FAT at LBA {}, "
      "data at LBA {}, root cluster {}",
      geometry->clusterCount, geometry->sectorsPerCluster,
      geometry->firstFatSector, geometry->firstDataSector,
      geometry->rootCluster);

  return Volume(device, *geometry, *bootSector);
}

// -----------------------------------------------------------------------------
// Cluster Addressing
// -----------------------------------------------------------------------------

// No range check: cluster >= 2 is the caller's contract, and smaller values
// wrap like any other unsigned 32-bit arithmetic.
uint32_t Volume::clusterToLba(uint32_t cluster) const {
  return geometry_.firstDataSector +
         (cluster - kFirstDataCluster) * geometry_.sectorsPerCluster;
}

// -----------------------------------------------------------------------------
// FAT Table Access
// -----------------------------------------------------------------------------

std::expected<uint32_t, FatVolumeResult> Volume::fatEntry(
    uint32_t cluster) const {
  return readFatEntry(*device_, geometry_, cluster);
}

ClusterChain Volume::walkChain(uint32_t startCluster) const {
  return ClusterChain(*device_, geometry_, startCluster);
}

std::expected<std::vector<uint32_t>, FatVolumeResult> Volume::collectChain(
    uint32_t startCluster) const {
  std::vector<uint32_t> clusters;
  ClusterChain chain = walkChain(startCluster);
  while (true) {
    auto next = chain.next();
    if (!next) {
      return std::unexpected(next.error());
    }
    if (!next->has_value()) {
      return clusters;
    }
    clusters.push_back(**next);
  }
}

// -----------------------------------------------------------------------------
// Metadata
// -----------------------------------------------------------------------------

std::expected<FsInfo, FatVolumeResult> Volume::readFsInfo() const {
  if (fsInfoSector_ == kNoFsInfoSector || fsInfoSector_ == kNoFsInfoSectorAlt ||
      fsInfoSector_ >= geometry_.reservedSectorCount) {
    return std::unexpected(FatVolumeResult::InvalidFat32Structure);
  }

  BlockDevice::Sector sector{};
  if (device_->readSector(fsInfoSector_, sector) != FatVolumeResult::Success) {
    return std::unexpected(FatVolumeResult::IoError);
  }

  if (readLe32(sector, kFsInfoLeadSignatureOffset) != kFsInfoLeadSignature ||
      readLe32(sector, kFsInfoStructSignatureOffset) !=
          kFsInfoStructSignature ||
      readLe32(sector, kFsInfoTrailSignatureOffset) != kFsInfoTrailSignature) {
    return std::unexpected(FatVolumeResult::InvalidFat32Structure);
  }

  auto hint = [&sector](size_t offset) -> std::optional<uint32_t> {
    uint32_t value = readLe32(sector, offset);
    if (value == kFsInfoUnknown) {
      return std::nullopt;
    }
    return value;
  };

  return FsInfo{
      .freeCount = hint(kFsInfoFreeCountOffset),
      .nextFree = hint(kFsInfoNextFreeOffset),
  };
}

std::expected<VolumeFlags, FatVolumeResult> Volume::readVolumeFlags() const {
  return readRawFatEntry(*device_, geometry_, kVolumeFlagsCluster)
      .transform([](uint32_t raw) {
        return VolumeFlags{
            .cleanShutdown = (raw & kCleanShutdownBit) != 0,
            .noHardErrors = (raw & kNoHardErrorsBit) != 0,
        };
      });
}

// -----------------------------------------------------------------------------
// Cluster Data
// -----------------------------------------------------------------------------

FatVolumeResult Volume::readCluster(uint32_t cluster,
                                    std::span<std::byte> out) const {
  if (!geometry_.isDataCluster(cluster)) {
    return FatVolumeResult::InvalidFat32Structure;
  }
  if (out.size() < bytesPerCluster()) {
    return FatVolumeResult::BufferTooSmall;
  }

  const uint32_t firstLba = clusterToLba(cluster);
  for (uint32_t i = 0; i < geometry_.sectorsPerCluster; i++) {
    auto target = out.subspan(static_cast<size_t>(i) * BlockDevice::kSectorSize)
                      .first<BlockDevice::kSectorSize>();
    if (device_->readSector(firstLba + i, target) !=
        FatVolumeResult::Success) {
      return FatVolumeResult::IoError;
    }
  }
  return FatVolumeResult::Success;
}

}  // namespace fatVolume
