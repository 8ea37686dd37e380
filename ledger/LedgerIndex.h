#ifndef HASHVOTE_LEDGER_INDEX_H
#define HASHVOTE_LEDGER_INDEX_H

#include "VoteStore.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace hv {

/**
 * In-memory view of a ledger with the lookups needed to validate appends.
 * Not thread safe; owners serialize access.
 */
class LedgerIndex {
public:
  /**
   * Check that `block` may be appended: it extends the tip of its poll and
   * is unique by (pollId, voterHash) and by blockHash
   */
  VoteStore::Roe<void> checkAppend(const VoteBlock &block) const;

  /**
   * Add a block without checks. Used for blocks already validated or read
   * back from storage.
   */
  void add(const VoteBlock &block);

  void clear();

  uint64_t size() const { return blocks_.size(); }
  uint64_t nextId() const { return blocks_.size() + 1; }

  const std::vector<VoteBlock> &getBlocks() const { return blocks_; }
  std::vector<VoteBlock> getPoll(const std::string &pollId) const;
  std::string getTip(const std::string &pollId) const;
  const VoteBlock *findVote(const std::string &pollId,
                            const std::string &voterHash) const;

private:
  std::vector<VoteBlock> blocks_;
  // pollId -> positions in blocks_
  std::map<std::string, std::vector<size_t>> polls_;
  std::map<std::pair<std::string, std::string>, size_t> voters_;
  std::set<std::string> hashes_;
};

} // namespace hv

#endif // HASHVOTE_LEDGER_INDEX_H
