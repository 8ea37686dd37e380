#ifndef HASHVOTE_CHAIN_AUDITOR_H
#define HASHVOTE_CHAIN_AUDITOR_H

#include "VoteBlock.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hv {

/**
 * Integrity checks over committed blocks.
 *
 * A poll chain is walked in insertion order. For every block the proof of
 * work is checked under the supplied difficulty, the stored hash is compared
 * with the recomputed one and prevHash must equal the previous block's hash
 * (genesis for the first). An empty chain is valid.
 */
class ChainAuditor : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INTEGRITY = 1;

  enum class ViolationKind {
    PROOF_OF_WORK,
    HASH_MISMATCH,
    BROKEN_LINK,
    DUPLICATE_VOTER,
    DUPLICATE_HASH
  };

  struct Violation {
    uint64_t blockId{ 0 };
    std::string pollId;
    std::string blockHash;
    ViolationKind kind{ ViolationKind::PROOF_OF_WORK };
    std::string message;

    nlohmann::json ltsToJson() const;
  };

  // Difficulty bits to audit a poll with
  using BitsForPoll = std::function<int(const std::string &pollId)>;

  ChainAuditor();
  ~ChainAuditor() override = default;

  /**
   * @return true iff the ordered blocks of one poll form a valid chain.
   * Stops at the first violation. Invalid bits never verify, even for an
   * empty chain.
   */
  bool verifyChain(const std::vector<VoteBlock> &blocks, int bits) const;

  /**
   * Walk the whole chain and record every violation
   */
  std::vector<Violation> diagnoseChain(const std::vector<VoteBlock> &blocks,
                                       int bits) const;

  /**
   * Same as verifyChain, reporting the first violation as E_INTEGRITY
   */
  Roe<void> checkChain(const std::vector<VoteBlock> &blocks, int bits) const;

  /**
   * Ledger wide (pollId, voterHash) and blockHash uniqueness.
   * Every block after the first of a duplicate group is reported.
   */
  std::vector<Violation>
  diagnoseUniqueness(const std::vector<VoteBlock> &allBlocks) const;

  /**
   * Check every poll chain of the ledger with its own difficulty, then
   * ledger wide uniqueness
   */
  std::vector<Violation> auditLedger(const std::vector<VoteBlock> &allBlocks,
                                     const BitsForPoll &bitsForPoll) const;

private:
  // Returns false when stopOnFirst is set and a violation was found
  bool walkChain(const std::vector<VoteBlock> &blocks, int bits,
                 bool stopOnFirst, std::vector<Violation> &out) const;
};

std::string toString(ChainAuditor::ViolationKind kind);

} // namespace hv

#endif // HASHVOTE_CHAIN_AUDITOR_H
