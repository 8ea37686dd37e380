#ifndef HASHVOTE_VOTE_BLOCK_H
#define HASHVOTE_VOTE_BLOCK_H

#include "../pow/BlockHasher.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace hv {

/**
 * One committed vote. Immutable once appended to a VoteStore.
 */
struct VoteBlock {
  // Ledger wide insertion sequence, 1-based, assigned by the store
  uint64_t id{ 0 };
  std::string pollId;
  std::string voterHash;
  std::string choice;
  int64_t timestampUs{ 0 };
  std::string prevHash;
  uint64_t nonce{ 0 };
  std::string blockHash;

  template <typename Archive> void serialize(Archive &ar) {
    ar &id &pollId &voterHash &choice &timestampUs &prevHash &nonce &blockHash;
  }

  pow::BlockFields fields() const;

  // Hash recomputed from the fields, to compare against blockHash
  std::string computeHash() const;

  std::string timestampString() const;

  nlohmann::json ltsToJson() const;
};

} // namespace hv

#endif // HASHVOTE_VOTE_BLOCK_H
