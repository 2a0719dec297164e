/// @file InspectImage.cpp
/// @brief Minimal C++ CLI for inspecting the metadata of a FAT32 image.
///
/// Usage: inspect_image <path> [partition-lba]
///
/// Opens the image at @p path read-only, optionally skips to the partition
/// starting at @p partition-lba, mounts the volume, and prints its geometry,
/// the FSInfo hints, the FAT[1] state flags, and the root directory's cluster
/// chain.  Exits 0 when the volume mounts and the root chain walks to a clean
/// end-of-chain, 1 otherwise.
///
/// FSInfo and state flag problems are reported but do not fail the run: both
/// are advisory.

#include <cstdint>
#include <cstdio>
#include <memory>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>

#include "FatVolumeResult.h"
#include "ImageBlockDevice.h"
#include "PartitionBlockDevice.h"
#include "Volume.h"

static void printGeometry(const fatVolume::Volume& volume) {
  const fatVolume::VolumeGeometry& g = volume.geometry();
  std::string_view label(volume.volumeLabel().data(),
                         volume.volumeLabel().size());

  std::println("[InspectImage] Label:             '{}'", label);
  std::println("[InspectImage] Volume ID:         0x{:08X}", volume.volumeId());
  std::println("[InspectImage] Bytes/sector:      {}", g.bytesPerSector);
  std::println("[InspectImage] Sectors/cluster:   {}", g.sectorsPerCluster);
  std::println("[InspectImage] Reserved sectors:  {}", g.reservedSectorCount);
  std::println("[InspectImage] FAT count:         {}", g.fatCount);
  std::println("[InspectImage] FAT size:          {}", g.fatSize);
  std::println("[InspectImage] Total sectors:     {}", g.totalSectors);
  std::println("[InspectImage] First FAT sector:  {}", g.firstFatSector);
  std::println("[InspectImage] First data sector: {}", g.firstDataSector);
  std::println("[InspectImage] Cluster count:     {}", g.clusterCount);
  std::println("[InspectImage] Root cluster:      {}", g.rootCluster);
}

static void printMetadata(const fatVolume::Volume& volume) {
  if (auto info = volume.readFsInfo()) {
    std::println("[InspectImage] FSInfo free count: {}",
                 info->freeCount ? std::to_string(*info->freeCount)
                                 : std::string("unknown"));
    std::println("[InspectImage] FSInfo next free:  {}",
                 info->nextFree ? std::to_string(*info->nextFree)
                                : std::string("unknown"));
  } else {
    std::println(stderr, "Warning: FSInfo unreadable ({})",
                 toString(info.error()));
  }

  if (auto flags = volume.readVolumeFlags()) {
    std::println("[InspectImage] Clean shutdown:    {}",
                 flags->cleanShutdown ? "yes" : "no");
    std::println("[InspectImage] No hard errors:    {}",
                 flags->noHardErrors ? "yes" : "no");
  } else {
    std::println(stderr, "Warning: volume flags unreadable ({})",
                 toString(flags.error()));
  }
}

static bool printRootChain(const fatVolume::Volume& volume) {
  std::println("[InspectImage] Walking root chain from cluster {}...",
               volume.rootCluster());

  fatVolume::ClusterChain chain = volume.walkChain(volume.rootCluster());
  while (true) {
    auto next = chain.next();
    if (!next) {
      std::println(stderr, "Error: root chain broken after {} cluster(s) ({})",
                   chain.stepCount(), toString(next.error()));
      return false;
    }
    if (!next->has_value()) {
      break;
    }
    std::println("[InspectImage]   cluster {} at LBA {}", **next,
                 volume.clusterToLba(**next));
  }

  std::println("[InspectImage] Root chain: {} cluster(s)", chain.stepCount());
  return true;
}

int main(int argc, char* argv[]) {
  if (argc != 2 && argc != 3) {
    std::println(stderr, "Usage: inspect_image <path> [partition-lba]");
    return 1;
  }

  const std::string path = argv[1];
  uint32_t partitionLba = 0;
  if (argc == 3) {
    try {
      unsigned long long value = std::stoull(argv[2]);
      if (value > UINT32_MAX) {
        throw std::out_of_range("partition-lba");
      }
      partitionLba = static_cast<uint32_t>(value);
    } catch (const std::exception&) {
      std::println(stderr, "Error: invalid partition LBA '{}'", argv[2]);
      return 1;
    }
  }

  auto image = fatVolume::ImageBlockDevice::open(path);
  if (!image) {
    std::println(stderr, "Error: Failed to open '{}'", path);
    return 1;
  }

  std::unique_ptr<fatVolume::PartitionBlockDevice> partition;
  fatVolume::BlockDevice* device = &*image;
  if (partitionLba != 0) {
    partition =
        std::make_unique<fatVolume::PartitionBlockDevice>(*image, partitionLba);
    device = partition.get();
  }

  std::println("[InspectImage] Mounting '{}' at LBA {}...", path,
               partitionLba);
  auto volume = fatVolume::Volume::mount(*device);
  if (!volume) {
    std::println(stderr, "Error: mount failed ({})", toString(volume.error()));
    return 1;
  }

  printGeometry(*volume);
  printMetadata(*volume);
  if (!printRootChain(*volume)) {
    return 1;
  }

  std::println("[InspectImage] Done.");
  return 0;
}
