#include "VolumeGeometry.h"

#include <limits>

#include "LittleEndian.h"

namespace fatVolume {

// -----------------------------------------------------------------------------
// Geometry Derivation
// -----------------------------------------------------------------------------

std::expected<VolumeGeometry, FatVolumeResult> VolumeGeometry::fromBootSector(
    const BootSector& bootSector) {
  if (bootSector.bytesPerSector == 0 || bootSector.sectorsPerCluster == 0 ||
      bootSector.fatCount == 0 || bootSector.fatSize32 == 0) {
    return std::unexpected(FatVolumeResult::InvalidFat32Structure);
  }

  const uint64_t firstDataSector =
      static_cast<uint64_t>(bootSector.reservedSectorCount) +
      static_cast<uint64_t>(bootSector.fatCount) * bootSector.fatSize32;
  if (firstDataSector > std::numeric_limits<uint32_t>::max()) {
    return std::unexpected(FatVolumeResult::InvalidFat32Structure);
  }
  if (bootSector.totalSectors32 < firstDataSector) {
    return std::unexpected(FatVolumeResult::InvalidFat32Structure);
  }

  const uint32_t dataSectors =
      bootSector.totalSectors32 - static_cast<uint32_t>(firstDataSector);
  const uint32_t clusterCount = dataSectors / bootSector.sectorsPerCluster;

  // Entries past the end of FAT #0 would be read from the next copy or from
  // the data region.
  const uint64_t entriesPerFat = static_cast<uint64_t>(bootSector.fatSize32) *
                                 (bootSector.bytesPerSector / kFatEntrySize);
  if (entriesPerFat < static_cast<uint64_t>(clusterCount) + kFirstDataCluster) {
    return std::unexpected(FatVolumeResult::InvalidFat32Structure);
  }

  return VolumeGeometry{
      .bytesPerSector = bootSector.bytesPerSector,
      .sectorsPerCluster = bootSector.sectorsPerCluster,
      .reservedSectorCount = bootSector.reservedSectorCount,
      .fatCount = bootSector.fatCount,
      .fatSize = bootSector.fatSize32,
      .rootCluster = bootSector.rootCluster,
      .totalSectors = bootSector.totalSectors32,
      .firstFatSector = bootSector.reservedSectorCount,
      .firstDataSector = static_cast<uint32_t>(firstDataSector),
      .clusterCount = clusterCount,
  };
}

bool VolumeGeometry::isDataCluster(uint32_t cluster) const {
  return cluster >= kFirstDataCluster &&
         static_cast<uint64_t>(cluster) <
             static_cast<uint64_t>(clusterCount) + kFirstDataCluster;
}

// -----------------------------------------------------------------------------
// FAT Table Access
// -----------------------------------------------------------------------------

std::expected<uint32_t, FatVolumeResult> readRawFatEntry(
    BlockDevice& device, const VolumeGeometry& geometry, uint32_t cluster) {
  const uint64_t offset = static_cast<uint64_t>(cluster) * kFatEntrySize;
  const uint32_t sectorLba =
      geometry.firstFatSector +
      static_cast<uint32_t>(offset / geometry.bytesPerSector);
  const size_t withinSector =
      static_cast<size_t>(offset % geometry.bytesPerSector);

  BlockDevice::Sector sector{};
  if (device.readSector(sectorLba, sector) != FatVolumeResult::Success) {
    return std::unexpected(FatVolumeResult::IoError);
  }
  return readLe32(sector, withinSector);
}

std::expected<uint32_t, FatVolumeResult> readFatEntry(
    BlockDevice& device, const VolumeGeometry& geometry, uint32_t cluster) {
  if (!geometry.isDataCluster(cluster)) {
    return std::unexpected(FatVolumeResult::InvalidFat32Structure);
  }
  return readRawFatEntry(device, geometry, cluster)
      .transform([](uint32_t raw) { return raw & kFatEntryMask; });
}

}  // namespace fatVolume
