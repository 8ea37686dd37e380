#include "MemoryVoteStore.h"

namespace hv {

MemoryVoteStore::MemoryVoteStore() : VoteStore("hashvote.store.memory") {}

VoteStore::Roe<std::vector<VoteBlock>>
MemoryVoteStore::readPoll(const std::string &pollId) {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.getPoll(pollId);
}

VoteStore::Roe<std::vector<VoteBlock>> MemoryVoteStore::readAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.getBlocks();
}

VoteStore::Roe<std::string>
MemoryVoteStore::getTip(const std::string &pollId) {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.getTip(pollId);
}

VoteStore::Roe<std::optional<VoteBlock>>
MemoryVoteStore::findVote(const std::string &pollId,
                          const std::string &voterHash) {
  std::lock_guard<std::mutex> lock(mutex_);
  const VoteBlock *found = index_.findVote(pollId, voterHash);
  if (!found) {
    return std::optional<VoteBlock>();
  }
  return std::optional<VoteBlock>(*found);
}

VoteStore::Roe<VoteBlock> MemoryVoteStore::append(const VoteBlock &block) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto check = index_.checkAppend(block);
  if (!check) {
    log().debug << "Rejected append to poll " << block.pollId << ": "
                << check.error().message;
    return check.error();
  }
  VoteBlock stored = block;
  stored.id = index_.nextId();
  index_.add(stored);
  log().debug << "Appended block " << stored.id << " to poll "
              << stored.pollId;
  return stored;
}

void MemoryVoteStore::appendUnchecked(const VoteBlock &block) {
  std::lock_guard<std::mutex> lock(mutex_);
  VoteBlock stored = block;
  stored.id = index_.nextId();
  index_.add(stored);
}

} // namespace hv
