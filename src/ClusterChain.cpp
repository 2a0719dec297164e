#include "ClusterChain.h"

#include "VolumeGeometry.h"

namespace fatVolume {

ClusterChain::ClusterChain(BlockDevice& device, const VolumeGeometry& geometry,
                           uint32_t startCluster)
    : device_(&device),
      geometry_(geometry),
      current_(startCluster),
      steps_(0),
      state_(State::Walking),
      failure_(FatVolumeResult::Success) {}

std::unexpected<FatVolumeResult> ClusterChain::fail(FatVolumeResult result) {
  state_ = State::Failed;
  failure_ = result;
  return std::unexpected(result);
}

std::expected<std::optional<uint32_t>, FatVolumeResult> ClusterChain::next() {
  switch (state_) {
    case State::Ended:
      return std::nullopt;
    case State::Failed:
      return std::unexpected(failure_);
    case State::Walking:
      break;
  }

  // A chain can hold at most clusterCount distinct clusters. Needing one more
  // step means some cluster links back into the chain.
  if (steps_ >= geometry_.clusterCount) {
    return fail(FatVolumeResult::InvalidFat32Structure);
  }

  // Range-checks current_; an out-of-range link from the previous step
  // fails here.
  auto entry = readFatEntry(*device_, geometry_, current_);
  if (!entry) {
    return fail(entry.error());
  }

  const uint32_t cluster = current_;
  steps_++;

  if (isEndOfChain(*entry)) {
    state_ = State::Ended;
  } else if (*entry == kFatBadCluster || *entry == kFatFreeCluster ||
             *entry == kFatReservedCluster) {
    // Report the broken link on the next call, after this cluster.
    state_ = State::Failed;
    failure_ = FatVolumeResult::InvalidFat32Structure;
  } else {
    current_ = *entry;
  }

  return cluster;
}

}  // namespace fatVolume
