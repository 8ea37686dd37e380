#ifndef HASHVOTE_POLL_REPORTER_H
#define HASHVOTE_POLL_REPORTER_H

#include "DifficultyPolicy.h"
#include "../ledger/ChainAuditor.h"
#include "../ledger/VoteStore.hpp"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hv {

/**
 * Read side of the ledger: poll results, audit trails and statistics.
 * Results are only reported for polls whose chain verifies.
 */
class PollReporter : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_STORAGE = 1;
  constexpr static int32_t E_INTEGRITY = 2;
  constexpr static int32_t E_VALIDATION = 3;

  constexpr static size_t DEFAULT_TOP_POLLS = 5;

  struct PollResult {
    std::string pollId;
    int difficultyBits{ 0 };
    uint64_t totalVotes{ 0 };
    std::map<std::string, uint64_t> tally;

    nlohmann::json ltsToJson() const;
  };

  struct AuditTrail {
    std::string pollId;
    int difficultyBits{ 0 };
    bool valid{ true };
    std::vector<VoteBlock> blocks;
    std::vector<ChainAuditor::Violation> violations;

    nlohmann::json ltsToJson() const;
  };

  struct LedgerAudit {
    bool valid{ true };
    uint64_t totalBlocks{ 0 };
    std::vector<ChainAuditor::Violation> violations;

    nlohmann::json ltsToJson() const;
  };

  struct PollCount {
    std::string pollId;
    uint64_t votes{ 0 };
    int64_t firstVoteUs{ 0 };
    int64_t lastVoteUs{ 0 };
  };

  struct LedgerStats {
    uint64_t totalBlocks{ 0 };
    uint64_t uniquePolls{ 0 };
    uint64_t uniqueVoters{ 0 };
    // Most voted polls first
    std::vector<PollCount> topPolls;
    std::optional<VoteBlock> latestVote;

    nlohmann::json ltsToJson() const;
  };

  struct ChoiceStat {
    std::string choice;
    uint64_t count{ 0 };
    // Share of all votes in scope, rounded to two decimals
    double percentage{ 0.0 };
  };

  struct VoteStats {
    // Empty for ledger wide statistics
    std::string pollId;
    uint64_t totalVotes{ 0 };
    std::vector<ChoiceStat> choices;
    // "YYYY-MM-DD" (UTC) -> votes
    std::map<std::string, uint64_t> votesPerDay;
    // Only filled for ledger wide statistics
    std::vector<PollCount> polls;

    nlohmann::json ltsToJson() const;
  };

  PollReporter(VoteStore &store, const DifficultyPolicy &policy);
  ~PollReporter() override = default;

  /**
   * Count votes per choice after verifying the poll's chain
   * @return E_INTEGRITY if the chain does not verify
   */
  Roe<PollResult> getResult(const std::string &pollId);

  Roe<AuditTrail> getAuditTrail(const std::string &pollId);

  /**
   * Verify every poll chain with its own difficulty plus ledger wide
   * uniqueness
   */
  Roe<LedgerAudit> auditLedger();

  Roe<LedgerStats> getLedgerStats(size_t topN = DEFAULT_TOP_POLLS);

  /**
   * @param pollId Restrict to one poll; empty for the whole ledger
   */
  Roe<VoteStats> getVoteStats(const std::string &pollId = "");

private:
  static std::vector<PollCount> countPolls(const std::vector<VoteBlock> &blocks);

  VoteStore &store_;
  DifficultyPolicy policy_;
  ChainAuditor auditor_;
};

} // namespace hv

#endif // HASHVOTE_POLL_REPORTER_H
