#include "DifficultyPolicy.h"
#include "../lib/Utilities.h"

namespace hv {

bool DifficultyPolicy::isLowStakes(const std::string &pollId) const {
  for (const auto &prefix : config_.lowStakesPrefixes) {
    if (!prefix.empty() && utl::startsWith(pollId, prefix)) {
      return true;
    }
  }
  return false;
}

int DifficultyPolicy::bitsFor(const std::string &pollId) const {
  return isLowStakes(pollId) ? config_.reducedBits : config_.defaultBits;
}

} // namespace hv
