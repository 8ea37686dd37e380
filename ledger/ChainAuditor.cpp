#include "ChainAuditor.h"
#include "../pow/Difficulty.h"

#include <map>
#include <set>
#include <utility>

namespace hv {

std::string toString(ChainAuditor::ViolationKind kind) {
  switch (kind) {
  case ChainAuditor::ViolationKind::PROOF_OF_WORK:
    return "proof_of_work";
  case ChainAuditor::ViolationKind::HASH_MISMATCH:
    return "hash_mismatch";
  case ChainAuditor::ViolationKind::BROKEN_LINK:
    return "broken_link";
  case ChainAuditor::ViolationKind::DUPLICATE_VOTER:
    return "duplicate_voter";
  case ChainAuditor::ViolationKind::DUPLICATE_HASH:
    return "duplicate_hash";
  }
  return "unknown";
}

nlohmann::json ChainAuditor::Violation::ltsToJson() const {
  nlohmann::json j;
  j["blockId"] = blockId;
  j["pollId"] = pollId;
  j["blockHash"] = blockHash;
  j["kind"] = toString(kind);
  j["message"] = message;
  return j;
}

ChainAuditor::ChainAuditor() : Module("hashvote.auditor") {}

bool ChainAuditor::walkChain(const std::vector<VoteBlock> &blocks, int bits,
                             bool stopOnFirst,
                             std::vector<Violation> &out) const {
  auto target = pow::computeTarget(bits);
  if (!target) {
    log().warning << target.error().message;
  }

  std::string expectedPrev = pow::GENESIS_HASH;
  for (const auto &block : blocks) {
    auto report = [&](ViolationKind kind, const std::string &message) {
      out.push_back({ block.id, block.pollId, block.blockHash, kind, message });
    };

    std::string recomputed = block.computeHash();

    if (!target || !pow::meetsTarget(recomputed, target.value())) {
      report(ViolationKind::PROOF_OF_WORK,
             "Proof of work does not meet " + std::to_string(bits) + " bits");
      if (stopOnFirst) {
        return false;
      }
    }

    if (recomputed != block.blockHash) {
      report(ViolationKind::HASH_MISMATCH,
             "Stored hash differs from recomputed hash " + recomputed);
      if (stopOnFirst) {
        return false;
      }
    }

    if (block.prevHash != expectedPrev) {
      report(ViolationKind::BROKEN_LINK,
             "prevHash " + block.prevHash + " does not match expected " +
                 expectedPrev);
      if (stopOnFirst) {
        return false;
      }
    }

    expectedPrev = block.blockHash;
  }
  return true;
}

bool ChainAuditor::verifyChain(const std::vector<VoteBlock> &blocks,
                               int bits) const {
  if (!pow::isValidBits(bits)) {
    log().warning << "Invalid difficulty bits " << bits;
    return false;
  }
  std::vector<Violation> violations;
  return walkChain(blocks, bits, true, violations);
}

std::vector<ChainAuditor::Violation>
ChainAuditor::diagnoseChain(const std::vector<VoteBlock> &blocks,
                            int bits) const {
  std::vector<Violation> violations;
  walkChain(blocks, bits, false, violations);
  return violations;
}

ChainAuditor::Roe<void>
ChainAuditor::checkChain(const std::vector<VoteBlock> &blocks,
                         int bits) const {
  if (!pow::isValidBits(bits)) {
    return Error(E_INTEGRITY, "Invalid difficulty bits " + std::to_string(bits));
  }
  std::vector<Violation> violations;
  if (!walkChain(blocks, bits, true, violations)) {
    const auto &v = violations.front();
    return Error(E_INTEGRITY, "Chain integrity compromised at block " +
                                  std::to_string(v.blockId) + " (" +
                                  toString(v.kind) + "): " + v.message);
  }
  return {};
}

std::vector<ChainAuditor::Violation> ChainAuditor::diagnoseUniqueness(
    const std::vector<VoteBlock> &allBlocks) const {
  std::vector<Violation> violations;
  std::set<std::pair<std::string, std::string>> voters;
  std::set<std::string> hashes;

  for (const auto &block : allBlocks) {
    if (!voters.insert({ block.pollId, block.voterHash }).second) {
      violations.push_back({ block.id, block.pollId, block.blockHash,
                             ViolationKind::DUPLICATE_VOTER,
                             "Voter " + block.voterHash +
                                 " voted more than once" });
    }
    if (!hashes.insert(block.blockHash).second) {
      violations.push_back({ block.id, block.pollId, block.blockHash,
                             ViolationKind::DUPLICATE_HASH,
                             "Block hash appears more than once" });
    }
  }
  return violations;
}

std::vector<ChainAuditor::Violation>
ChainAuditor::auditLedger(const std::vector<VoteBlock> &allBlocks,
                          const BitsForPoll &bitsForPoll) const {
  std::map<std::string, std::vector<VoteBlock>> polls;
  for (const auto &block : allBlocks) {
    polls[block.pollId].push_back(block);
  }

  std::vector<Violation> violations;
  for (const auto &[pollId, blocks] : polls) {
    int bits = bitsForPoll(pollId);
    walkChain(blocks, bits, false, violations);
  }

  auto uniqueness = diagnoseUniqueness(allBlocks);
  violations.insert(violations.end(), uniqueness.begin(), uniqueness.end());

  log().info << "Audited " << allBlocks.size() << " blocks in " << polls.size()
             << " polls: " << violations.size() << " violations";
  return violations;
}

} // namespace hv
