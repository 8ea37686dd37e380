#include "VoteAdmission.h"
#include "../lib/Utilities.h"
#include "../pow/Difficulty.h"
#include "../pow/PowVerifier.h"

#include <functional>

namespace hv {

nlohmann::json VoteAdmission::Quote::ltsToJson() const {
  nlohmann::json j;
  j["pollId"] = pollId;
  j["prevHash"] = prevHash;
  j["difficultyBits"] = difficultyBits;
  j["targetHex"] = targetHex;
  j["message"] = message;
  return j;
}

VoteAdmission::VoteAdmission(VoteStore &store, const DifficultyPolicy &policy)
    : Module("hashvote.admission"), store_(store), policy_(policy) {}

VoteAdmission::Roe<void>
VoteAdmission::validate(const std::string &pollId, const std::string &choice,
                        const std::string &voterHash) const {
  if (pollId.empty()) {
    return Error(E_VALIDATION, "pollId is required");
  }
  if (choice.empty()) {
    return Error(E_VALIDATION, "choice is required");
  }
  if (voterHash.empty()) {
    return Error(E_VALIDATION, "voterHash is required");
  }
  if (!utl::isLowerHex(voterHash, 64)) {
    return Error(E_VALIDATION,
                 "voterHash must be 64 lowercase hex characters");
  }
  return {};
}

VoteAdmission::Roe<void>
VoteAdmission::checkNotVoted(const std::string &pollId,
                             const std::string &voterHash) {
  auto existing = store_.findVote(pollId, voterHash);
  if (!existing) {
    return Error(E_STORAGE,
                 "Failed to look up voter: " + existing.error().message);
  }
  if (existing.value().has_value()) {
    return Error(E_CONFLICT, "Voter has already voted in poll " + pollId);
  }
  return {};
}

std::mutex &VoteAdmission::pollMutex(const std::string &pollId) {
  return pollMutexes_[std::hash<std::string>{}(pollId) % POLL_LOCK_STRIPES];
}

VoteAdmission::Roe<VoteAdmission::Quote>
VoteAdmission::quote(const VoteRequest &request) {
  auto valid = validate(request.pollId, request.choice, request.voterHash);
  if (!valid) {
    return valid.error();
  }
  auto notVoted = checkNotVoted(request.pollId, request.voterHash);
  if (!notVoted) {
    return notVoted.error();
  }

  auto tip = store_.getTip(request.pollId);
  if (!tip) {
    return Error(E_STORAGE, "Failed to read poll tip: " + tip.error().message);
  }

  int bits = policy_.bitsFor(request.pollId);
  auto target = pow::computeTargetHex(bits);
  if (!target) {
    return Error(E_VALIDATION, target.error().message);
  }

  Quote quote;
  quote.pollId = request.pollId;
  quote.prevHash = tip.value();
  quote.difficultyBits = bits;
  quote.targetHex = target.value();
  quote.message = "Find a nonce whose block hash has " + std::to_string(bits) +
                  " leading zero bits";
  log().debug << "Quoted poll " << request.pollId << " at " << bits
              << " bits, tip " << quote.prevHash;
  return quote;
}

VoteAdmission::Roe<VoteBlock>
VoteAdmission::commit(const VoteSubmission &submission) {
  auto valid =
      validate(submission.pollId, submission.choice, submission.voterHash);
  if (!valid) {
    return valid.error();
  }

  std::lock_guard<std::mutex> lock(pollMutex(submission.pollId));

  auto notVoted = checkNotVoted(submission.pollId, submission.voterHash);
  if (!notVoted) {
    return notVoted.error();
  }

  auto tip = store_.getTip(submission.pollId);
  if (!tip) {
    return Error(E_STORAGE, "Failed to read poll tip: " + tip.error().message);
  }

  VoteBlock block;
  block.pollId = submission.pollId;
  block.voterHash = submission.voterHash;
  block.choice = submission.choice;
  block.timestampUs = submission.timestampUs;
  block.prevHash = tip.value();
  block.nonce = submission.nonce;

  int bits = policy_.bitsFor(submission.pollId);
  if (!pow::verify(block.fields(), block.nonce, bits)) {
    log().info << "Rejected vote in poll " << submission.pollId
               << ": proof of work does not meet " << bits
               << " bits against the current tip";
    return Error(E_PROOF_OF_WORK,
                 "Proof of work is invalid for the current tip; recompute");
  }
  block.blockHash = block.computeHash();

  auto stored = store_.append(block);
  if (!stored) {
    const auto &err = stored.error();
    switch (err.code) {
    case VoteStore::E_DUPLICATE_VOTER:
      return Error(E_CONFLICT, "Voter has already voted in poll " +
                                   submission.pollId);
    case VoteStore::E_DUPLICATE_HASH:
      return Error(E_CONFLICT, "Block hash already exists: " + block.blockHash);
    case VoteStore::E_STALE_TIP:
      return Error(E_PROOF_OF_WORK,
                   "Poll tip moved before the vote was stored; recompute");
    default:
      log().error << "Failed to store vote: " << err.message;
      return Error(E_STORAGE, "Failed to store vote: " + err.message);
    }
  }

  log().info << "Committed block " << stored.value().id << " in poll "
             << stored.value().pollId;
  return stored.value();
}

} // namespace hv
