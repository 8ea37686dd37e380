#ifndef HASHVOTE_MEMORY_VOTE_STORE_H
#define HASHVOTE_MEMORY_VOTE_STORE_H

#include "LedgerIndex.h"
#include "VoteStore.hpp"

#include <mutex>

namespace hv {

/**
 * VoteStore kept in process memory. Thread safe.
 */
class MemoryVoteStore : public VoteStore {
public:
  MemoryVoteStore();
  ~MemoryVoteStore() override = default;

  Roe<std::vector<VoteBlock>> readPoll(const std::string &pollId) override;
  Roe<std::vector<VoteBlock>> readAll() override;
  Roe<std::string> getTip(const std::string &pollId) override;
  Roe<std::optional<VoteBlock>>
  findVote(const std::string &pollId, const std::string &voterHash) override;
  Roe<VoteBlock> append(const VoteBlock &block) override;

  /**
   * Insert a block as-is, bypassing all checks. Lets tests and tooling
   * build ledgers that violate the append rules.
   */
  void appendUnchecked(const VoteBlock &block);

private:
  mutable std::mutex mutex_;
  LedgerIndex index_;
};

} // namespace hv

#endif // HASHVOTE_MEMORY_VOTE_STORE_H
