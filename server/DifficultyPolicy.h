#ifndef HASHVOTE_DIFFICULTY_POLICY_H
#define HASHVOTE_DIFFICULTY_POLICY_H

#include <string>
#include <vector>

namespace hv {

/**
 * Maps a poll id to the difficulty bits required for its votes.
 * Polls whose id starts with a low stakes prefix use the reduced value,
 * every other poll the default. Admission and audit share one instance.
 */
class DifficultyPolicy {
public:
  constexpr static int DEFAULT_BITS = 18;
  constexpr static int REDUCED_BITS = 4;

  struct Config {
    int defaultBits{ DEFAULT_BITS };
    int reducedBits{ REDUCED_BITS };
    std::vector<std::string> lowStakesPrefixes{ "test_", "audit_" };
  };

  DifficultyPolicy() = default;
  explicit DifficultyPolicy(const Config &config) : config_(config) {}

  int bitsFor(const std::string &pollId) const;
  bool isLowStakes(const std::string &pollId) const;

  const Config &getConfig() const { return config_; }

private:
  Config config_;
};

} // namespace hv

#endif // HASHVOTE_DIFFICULTY_POLICY_H
