#ifndef CLUSTER_CHAIN_H
#define CLUSTER_CHAIN_H

#include <cstdint>
#include <expected>
#include <optional>

#include "BlockDevice.h"
#include "FatVolumeResult.h"
#include "VolumeGeometry.h"

namespace fatVolume {

class Volume;

// ClusterChain
// ------------
// A lazy walk over one file's cluster chain, created by Volume::walkChain().
//
// Each call to next() reads one FAT entry from the device and returns:
//   - the next cluster of the chain
//   - std::nullopt once the chain has ended cleanly (end-of-chain marker)
//   - InvalidFat32Structure on a bad, free, reserved or out-of-range link,
//     or once the walk exceeds the volume's cluster count (a cycle)
//   - IoError when the device read fails
//
// A cluster whose own link is broken is still returned; the error is reported
// by the following call. Once the walk has ended or failed, next() keeps
// returning that outcome.
//
// The walker keeps its own copy of the volume geometry and borrows only the
// block device, so it stays valid when the Volume is moved or destroyed. The
// device must outlive it.
class ClusterChain {
public:
  std::expected<std::optional<uint32_t>, FatVolumeResult> next();

  // Number of clusters returned so far.
  uint32_t stepCount() const { return steps_; }

private:
  friend class Volume;

  enum class State { Walking, Ended, Failed };

  ClusterChain(BlockDevice& device, const VolumeGeometry& geometry,
               uint32_t startCluster);

  std::unexpected<FatVolumeResult> fail(FatVolumeResult result);

  BlockDevice* device_;
  VolumeGeometry geometry_;
  uint32_t current_;
  uint32_t steps_;
  State state_;
  FatVolumeResult failure_;
};

}  // namespace fatVolume

#endif  // CLUSTER_CHAIN_H
