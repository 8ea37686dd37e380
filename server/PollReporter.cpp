#include "PollReporter.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace hv {

namespace {

nlohmann::json pollCountToJson(const PollReporter::PollCount &count) {
  nlohmann::json j;
  j["pollId"] = count.pollId;
  j["votes"] = count.votes;
  j["firstVote"] = utl::formatIsoMicros(count.firstVoteUs);
  j["lastVote"] = utl::formatIsoMicros(count.lastVoteUs);
  return j;
}

nlohmann::json violationsToJson(
    const std::vector<ChainAuditor::Violation> &violations) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &v : violations) {
    j.push_back(v.ltsToJson());
  }
  return j;
}

} // namespace

nlohmann::json PollReporter::PollResult::ltsToJson() const {
  nlohmann::json j;
  j["pollId"] = pollId;
  j["difficultyBits"] = difficultyBits;
  j["totalVotes"] = totalVotes;
  j["tally"] = tally;
  return j;
}

nlohmann::json PollReporter::AuditTrail::ltsToJson() const {
  nlohmann::json j;
  j["pollId"] = pollId;
  j["difficultyBits"] = difficultyBits;
  j["valid"] = valid;
  j["blocks"] = nlohmann::json::array();
  for (const auto &block : blocks) {
    j["blocks"].push_back(block.ltsToJson());
  }
  j["violations"] = violationsToJson(violations);
  return j;
}

nlohmann::json PollReporter::LedgerAudit::ltsToJson() const {
  nlohmann::json j;
  j["valid"] = valid;
  j["totalBlocks"] = totalBlocks;
  j["violations"] = violationsToJson(violations);
  return j;
}

nlohmann::json PollReporter::LedgerStats::ltsToJson() const {
  nlohmann::json j;
  j["totalBlocks"] = totalBlocks;
  j["uniquePolls"] = uniquePolls;
  j["uniqueVoters"] = uniqueVoters;
  j["topPolls"] = nlohmann::json::array();
  for (const auto &count : topPolls) {
    j["topPolls"].push_back(pollCountToJson(count));
  }
  if (latestVote) {
    nlohmann::json jLatest;
    jLatest["pollId"] = latestVote->pollId;
    jLatest["choice"] = latestVote->choice;
    jLatest["timestamp"] = latestVote->timestampString();
    j["latestVote"] = jLatest;
  } else {
    j["latestVote"] = nullptr;
  }
  return j;
}

nlohmann::json PollReporter::VoteStats::ltsToJson() const {
  nlohmann::json j;
  if (!pollId.empty()) {
    j["pollId"] = pollId;
  }
  j["totalVotes"] = totalVotes;
  j["choices"] = nlohmann::json::array();
  for (const auto &stat : choices) {
    nlohmann::json jStat;
    jStat["choice"] = stat.choice;
    jStat["count"] = stat.count;
    jStat["percentage"] = stat.percentage;
    j["choices"].push_back(jStat);
  }
  j["votesPerDay"] = votesPerDay;
  if (pollId.empty()) {
    j["polls"] = nlohmann::json::array();
    for (const auto &count : polls) {
      j["polls"].push_back(pollCountToJson(count));
    }
  }
  return j;
}

PollReporter::PollReporter(VoteStore &store, const DifficultyPolicy &policy)
    : Module("hashvote.reporter"), store_(store), policy_(policy) {}

PollReporter::Roe<PollReporter::PollResult>
PollReporter::getResult(const std::string &pollId) {
  if (pollId.empty()) {
    return Error(E_VALIDATION, "pollId is required");
  }
  auto blocks = store_.readPoll(pollId);
  if (!blocks) {
    return Error(E_STORAGE,
                 "Failed to read poll " + pollId + ": " + blocks.error().message);
  }

  int bits = policy_.bitsFor(pollId);
  auto integrity = auditor_.checkChain(blocks.value(), bits);
  if (!integrity) {
    log().warning << "Refusing result for poll " << pollId << ": "
                  << integrity.error().message;
    return Error(E_INTEGRITY, integrity.error().message);
  }

  PollResult result;
  result.pollId = pollId;
  result.difficultyBits = bits;
  result.totalVotes = blocks.value().size();
  for (const auto &block : blocks.value()) {
    ++result.tally[block.choice];
  }
  return result;
}

PollReporter::Roe<PollReporter::AuditTrail>
PollReporter::getAuditTrail(const std::string &pollId) {
  if (pollId.empty()) {
    return Error(E_VALIDATION, "pollId is required");
  }
  auto blocks = store_.readPoll(pollId);
  if (!blocks) {
    return Error(E_STORAGE,
                 "Failed to read poll " + pollId + ": " + blocks.error().message);
  }

  AuditTrail trail;
  trail.pollId = pollId;
  trail.difficultyBits = policy_.bitsFor(pollId);
  trail.blocks = blocks.value();
  trail.violations = auditor_.diagnoseChain(trail.blocks, trail.difficultyBits);
  trail.valid = trail.violations.empty();
  return trail;
}

PollReporter::Roe<PollReporter::LedgerAudit> PollReporter::auditLedger() {
  auto blocks = store_.readAll();
  if (!blocks) {
    return Error(E_STORAGE,
                 "Failed to read ledger: " + blocks.error().message);
  }

  LedgerAudit audit;
  audit.totalBlocks = blocks.value().size();
  audit.violations = auditor_.auditLedger(
      blocks.value(),
      [this](const std::string &pollId) { return policy_.bitsFor(pollId); });
  audit.valid = audit.violations.empty();
  return audit;
}

std::vector<PollReporter::PollCount>
PollReporter::countPolls(const std::vector<VoteBlock> &blocks) {
  std::map<std::string, PollCount> byPoll;
  for (const auto &block : blocks) {
    auto it = byPoll.find(block.pollId);
    if (it == byPoll.end()) {
      PollCount count;
      count.pollId = block.pollId;
      count.votes = 1;
      count.firstVoteUs = block.timestampUs;
      count.lastVoteUs = block.timestampUs;
      byPoll.emplace(block.pollId, count);
      continue;
    }
    auto &count = it->second;
    ++count.votes;
    count.firstVoteUs = std::min(count.firstVoteUs, block.timestampUs);
    count.lastVoteUs = std::max(count.lastVoteUs, block.timestampUs);
  }

  std::vector<PollCount> counts;
  counts.reserve(byPoll.size());
  for (const auto &entry : byPoll) {
    counts.push_back(entry.second);
  }
  std::stable_sort(counts.begin(), counts.end(),
                   [](const PollCount &a, const PollCount &b) {
                     return a.votes > b.votes;
                   });
  return counts;
}

PollReporter::Roe<PollReporter::LedgerStats>
PollReporter::getLedgerStats(size_t topN) {
  auto blocks = store_.readAll();
  if (!blocks) {
    return Error(E_STORAGE,
                 "Failed to read ledger: " + blocks.error().message);
  }

  LedgerStats stats;
  stats.totalBlocks = blocks.value().size();

  std::set<std::string> voters;
  for (const auto &block : blocks.value()) {
    voters.insert(block.voterHash);
    if (!stats.latestVote ||
        block.timestampUs >= stats.latestVote->timestampUs) {
      stats.latestVote = block;
    }
  }
  stats.uniqueVoters = voters.size();

  stats.topPolls = countPolls(blocks.value());
  stats.uniquePolls = stats.topPolls.size();
  if (stats.topPolls.size() > topN) {
    stats.topPolls.resize(topN);
  }
  return stats;
}

PollReporter::Roe<PollReporter::VoteStats>
PollReporter::getVoteStats(const std::string &pollId) {
  auto blocks = pollId.empty() ? store_.readAll() : store_.readPoll(pollId);
  if (!blocks) {
    return Error(E_STORAGE,
                 "Failed to read ledger: " + blocks.error().message);
  }

  VoteStats stats;
  stats.pollId = pollId;
  stats.totalVotes = blocks.value().size();

  std::map<std::string, uint64_t> byChoice;
  for (const auto &block : blocks.value()) {
    ++byChoice[block.choice];
    ++stats.votesPerDay[utl::formatDateUtc(block.timestampUs)];
  }

  for (const auto &[choice, count] : byChoice) {
    ChoiceStat stat;
    stat.choice = choice;
    stat.count = count;
    stat.percentage =
        std::round(static_cast<double>(count) * 10000.0 /
                   static_cast<double>(stats.totalVotes)) /
        100.0;
    stats.choices.push_back(stat);
  }
  std::stable_sort(stats.choices.begin(), stats.choices.end(),
                   [](const ChoiceStat &a, const ChoiceStat &b) {
                     return a.count > b.count;
                   });

  if (pollId.empty()) {
    stats.polls = countPolls(blocks.value());
  }
  return stats;
}

} // namespace hv
