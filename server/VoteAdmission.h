#ifndef HASHVOTE_VOTE_ADMISSION_H
#define HASHVOTE_VOTE_ADMISSION_H

#include "DifficultyPolicy.h"
#include "../ledger/VoteStore.hpp"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <array>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace hv {

/**
 * Two phase vote admission: quote, compute proof of work on the client,
 * commit.
 *
 * A quote is advisory. commit() re-reads the tip of the poll and verifies
 * the proof against it, so a quote that went stale is answered with
 * E_PROOF_OF_WORK and the caller searches again. The store's atomic append
 * is what finally rejects a second vote of the same voter or a block that no
 * longer extends the tip.
 */
class VoteAdmission : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_VALIDATION = 1;
  constexpr static int32_t E_CONFLICT = 2;
  constexpr static int32_t E_PROOF_OF_WORK = 3;
  constexpr static int32_t E_STORAGE = 4;

  // Polls hash onto a fixed set of commit locks
  constexpr static size_t POLL_LOCK_STRIPES = 64;

  struct VoteRequest {
    std::string pollId;
    std::string choice;
    std::string voterHash;
  };

  struct VoteSubmission {
    std::string pollId;
    std::string choice;
    std::string voterHash;
    uint64_t nonce{ 0 };
    int64_t timestampUs{ 0 };
  };

  struct Quote {
    std::string pollId;
    std::string prevHash;
    int difficultyBits{ 0 };
    std::string targetHex;
    std::string message;

    nlohmann::json ltsToJson() const;
  };

  VoteAdmission(VoteStore &store, const DifficultyPolicy &policy);
  ~VoteAdmission() override = default;

  Roe<Quote> quote(const VoteRequest &request);

  /**
   * Verify and append a vote
   * @return The committed block
   */
  Roe<VoteBlock> commit(const VoteSubmission &submission);

  const DifficultyPolicy &getPolicy() const { return policy_; }

private:
  Roe<void> validate(const std::string &pollId, const std::string &choice,
                     const std::string &voterHash) const;
  Roe<void> checkNotVoted(const std::string &pollId,
                          const std::string &voterHash);
  std::mutex &pollMutex(const std::string &pollId);

  VoteStore &store_;
  DifficultyPolicy policy_;

  std::array<std::mutex, POLL_LOCK_STRIPES> pollMutexes_;
};

} // namespace hv

#endif // HASHVOTE_VOTE_ADMISSION_H
