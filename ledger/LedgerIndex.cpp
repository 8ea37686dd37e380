#include "LedgerIndex.h"

namespace hv {

VoteStore::Roe<void> LedgerIndex::checkAppend(const VoteBlock &block) const {
  if (voters_.count({ block.pollId, block.voterHash }) > 0) {
    return VoteStore::Error(VoteStore::E_DUPLICATE_VOTER,
                            "Voter has already voted in poll " + block.pollId);
  }
  if (hashes_.count(block.blockHash) > 0) {
    return VoteStore::Error(VoteStore::E_DUPLICATE_HASH,
                            "Block hash already exists: " + block.blockHash);
  }
  std::string tip = getTip(block.pollId);
  if (block.prevHash != tip) {
    return VoteStore::Error(VoteStore::E_STALE_TIP,
                            "Block does not extend the tip of poll " +
                                block.pollId + " (tip " + tip + ")");
  }
  return {};
}

void LedgerIndex::add(const VoteBlock &block) {
  size_t pos = blocks_.size();
  blocks_.push_back(block);
  polls_[block.pollId].push_back(pos);
  voters_.emplace(std::make_pair(block.pollId, block.voterHash), pos);
  hashes_.insert(block.blockHash);
}

void LedgerIndex::clear() {
  blocks_.clear();
  polls_.clear();
  voters_.clear();
  hashes_.clear();
}

std::vector<VoteBlock> LedgerIndex::getPoll(const std::string &pollId) const {
  std::vector<VoteBlock> result;
  auto it = polls_.find(pollId);
  if (it == polls_.end()) {
    return result;
  }
  result.reserve(it->second.size());
  for (size_t pos : it->second) {
    result.push_back(blocks_[pos]);
  }
  return result;
}

std::string LedgerIndex::getTip(const std::string &pollId) const {
  auto it = polls_.find(pollId);
  if (it == polls_.end() || it->second.empty()) {
    return pow::GENESIS_HASH;
  }
  return blocks_[it->second.back()].blockHash;
}

const VoteBlock *LedgerIndex::findVote(const std::string &pollId,
                                       const std::string &voterHash) const {
  auto it = voters_.find({ pollId, voterHash });
  if (it == voters_.end()) {
    return nullptr;
  }
  return &blocks_[it->second];
}

} // namespace hv
