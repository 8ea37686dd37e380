#include "../ledger/ChainAuditor.h"
#include "../ledger/FileVoteStore.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"
#include "../pow/Difficulty.h"
#include "../pow/NonceSearcher.h"
#include "../server/Config.h"
#include "../server/PollReporter.h"
#include "../server/VoteAdmission.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

constexpr const char *FILE_LOG = "hashvote.log";

std::atomic<bool> g_interrupted{ false };

void signalHandler(int signal) {
  if (signal == SIGINT) {
    g_interrupted = true;
  }
}

void printJson(const nlohmann::json &j) { std::cout << j.dump(2) << std::endl; }

int printError(int32_t code, const std::string &message) {
  nlohmann::json j;
  j["error"]["code"] = code;
  j["error"]["message"] = message;
  printJson(j);
  return 1;
}

// Ledger backed state shared by the subcommands that need the work directory
struct Context {
  hv::RunFileConfig config;
  hv::FileVoteStore store;
  hv::DifficultyPolicy policy;
};

hv::RunFileConfig::Roe<void> openContext(const std::string &workDir,
                                         bool debugMode, Context &ctx) {
  auto logger = hv::logging::getRootLogger();

  auto config = hv::RunFileConfig::loadOrCreate(workDir, logger);
  if (!config) {
    return config.error();
  }
  ctx.config = config.value();

  hv::logging::Level level = hv::logging::Level::INFO;
  hv::logging::parseLevel(ctx.config.logLevel, level);
  if (debugMode) {
    level = hv::logging::Level::DEBUG;
  }
  logger.setLevel(level);

  std::filesystem::path logPath = std::filesystem::path(workDir) / FILE_LOG;
  try {
    logger.addFileHandler(logPath.string(), hv::logging::Level::DEBUG);
  } catch (const std::exception &e) {
    logger.warning << "File logging disabled: " << e.what();
  }

  ctx.policy = hv::DifficultyPolicy(ctx.config.difficulty);

  std::filesystem::path ledgerPath(ctx.config.ledgerFile);
  if (ledgerPath.is_relative()) {
    ledgerPath = std::filesystem::path(workDir) / ledgerPath;
  }
  auto opened = ctx.store.open(ledgerPath.string());
  if (!opened) {
    return hv::RunFileConfig::Error(hv::RunFileConfig::E_IO,
                                    "Failed to open ledger " +
                                        ledgerPath.string() + ": " +
                                        opened.error().message);
  }
  return {};
}

// Search for a nonce in the background so Ctrl+C can cancel it
std::optional<uint64_t> searchNonce(const Context &ctx,
                                    const hv::pow::BlockFields &fields,
                                    int bits) {
  hv::pow::SearchTask task(
      ctx.config.searcherConfig(), fields, bits,
      std::chrono::seconds(ctx.config.search.timeoutSeconds));
  task.redirectLogger("hashvote.cli");

  auto started = task.start();
  if (!started) {
    hv::logging::getLogger("hashvote.cli").error
        << "Failed to start search: " << started.error().message;
    return std::nullopt;
  }
  while (task.isRunning()) {
    if (g_interrupted) {
      task.stop();
      return std::nullopt;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return task.waitForResult();
}

int runVote(Context &ctx, const std::string &pollId, const std::string &choice,
            const std::string &voterId,
            const std::optional<int64_t> &timestampUs) {
  auto logger = hv::logging::getLogger("hashvote.cli");
  hv::VoteAdmission admission(ctx.store, ctx.policy);

  std::string voterHash = hv::utl::deriveVoterHash(voterId);
  uint32_t maxAttempts = ctx.config.search.maxAttempts;

  for (uint32_t attempt = 1; attempt <= maxAttempts; ++attempt) {
    auto quote = admission.quote({ pollId, choice, voterHash });
    if (!quote) {
      return printError(quote.error().code, quote.error().message);
    }
    logger.info << "Searching proof of work for poll " << pollId << " at "
                << quote.value().difficultyBits << " bits (attempt "
                << attempt << "/" << maxAttempts << ")";

    hv::pow::BlockFields fields{ pollId, voterHash, choice,
                                 timestampUs.value_or(
                                     hv::utl::getCurrentTimeUs()),
                                 quote.value().prevHash };
    auto nonce = searchNonce(ctx, fields, quote.value().difficultyBits);
    if (g_interrupted) {
      return printError(hv::VoteAdmission::E_PROOF_OF_WORK, "Interrupted");
    }
    if (!nonce) {
      return printError(hv::VoteAdmission::E_PROOF_OF_WORK,
                        "No proof of work found within " +
                            std::to_string(ctx.config.search.timeoutSeconds) +
                            " seconds");
    }

    auto block = admission.commit(
        { pollId, choice, voterHash, *nonce, fields.timestampUs });
    if (block) {
      printJson(block.value().ltsToJson());
      return 0;
    }
    if (block.error().code != hv::VoteAdmission::E_PROOF_OF_WORK) {
      return printError(block.error().code, block.error().message);
    }
    logger.warning << "Commit rejected: " << block.error().message;
  }
  return printError(hv::VoteAdmission::E_PROOF_OF_WORK,
                    "Gave up after " + std::to_string(maxAttempts) +
                        " attempts");
}

int runResult(Context &ctx, const std::string &pollId) {
  hv::PollReporter reporter(ctx.store, ctx.policy);
  auto result = reporter.getResult(pollId);
  if (!result) {
    return printError(result.error().code, result.error().message);
  }
  printJson(result.value().ltsToJson());
  return 0;
}

int runAudit(Context &ctx, const std::string &pollId) {
  hv::PollReporter reporter(ctx.store, ctx.policy);
  if (pollId.empty()) {
    auto audit = reporter.auditLedger();
    if (!audit) {
      return printError(audit.error().code, audit.error().message);
    }
    printJson(audit.value().ltsToJson());
    return audit.value().valid ? 0 : 1;
  }
  auto trail = reporter.getAuditTrail(pollId);
  if (!trail) {
    return printError(trail.error().code, trail.error().message);
  }
  printJson(trail.value().ltsToJson());
  return trail.value().valid ? 0 : 1;
}

int runVerify(Context &ctx, const std::string &pollId) {
  auto blocks = ctx.store.readPoll(pollId);
  if (!blocks) {
    return printError(blocks.error().code, blocks.error().message);
  }
  hv::ChainAuditor auditor;
  int bits = ctx.policy.bitsFor(pollId);

  nlohmann::json j;
  j["pollId"] = pollId;
  j["difficultyBits"] = bits;
  j["blocks"] = blocks.value().size();
  j["valid"] = auditor.verifyChain(blocks.value(), bits);
  printJson(j);
  return j["valid"].get<bool>() ? 0 : 1;
}

int runStats(Context &ctx, bool votes, const std::string &pollId,
             size_t topN) {
  hv::PollReporter reporter(ctx.store, ctx.policy);
  if (votes || !pollId.empty()) {
    auto stats = reporter.getVoteStats(pollId);
    if (!stats) {
      return printError(stats.error().code, stats.error().message);
    }
    printJson(stats.value().ltsToJson());
    return 0;
  }
  auto stats = reporter.getLedgerStats(topN);
  if (!stats) {
    return printError(stats.error().code, stats.error().message);
  }
  printJson(stats.value().ltsToJson());
  return 0;
}

int runTarget(int bits) {
  auto target = hv::pow::computeTargetHex(bits);
  if (!target) {
    return printError(target.error().code, target.error().message);
  }
  nlohmann::json j;
  j["difficultyBits"] = bits;
  j["target"] = target.value();
  printJson(j);
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "hashvote - Proof of work voting ledger" };
  app.require_subcommand(1);

  std::string workDir = ".";
  app.add_option("-d,--work-dir", workDir,
                 "Work directory holding config.json and the ledger");

  bool debugMode = false;
  app.add_flag("--debug", debugMode, "Enable debug logging");

  std::string pollId;
  std::string choice;
  std::string voterId;

  auto *voteCmd = app.add_subcommand("vote", "Cast a vote");
  voteCmd->add_option("-p,--poll", pollId, "Poll id")->required();
  voteCmd->add_option("-c,--choice", choice, "Choice")->required();
  voteCmd->add_option("-v,--voter", voterId, "Voter identifier")->required();
  std::string timestamp;
  voteCmd->add_option("-t,--timestamp", timestamp,
                      "Vote time, YYYY-MM-DDTHH:MM:SS[.ffffff] UTC "
                      "(default: now)");

  auto *resultCmd = app.add_subcommand("result", "Tally a poll");
  resultCmd->add_option("-p,--poll", pollId, "Poll id")->required();

  auto *auditCmd =
      app.add_subcommand("audit", "Audit trail of a poll, or the whole ledger");
  auditCmd->add_option("-p,--poll", pollId, "Poll id (default: all polls)");

  auto *verifyCmd = app.add_subcommand("verify", "Verify the chain of a poll");
  verifyCmd->add_option("-p,--poll", pollId, "Poll id")->required();

  bool voteStats = false;
  size_t topN = hv::PollReporter::DEFAULT_TOP_POLLS;
  auto *statsCmd = app.add_subcommand("stats", "Ledger or vote statistics");
  statsCmd->add_flag("--votes", voteStats, "Per choice vote statistics");
  statsCmd->add_option("-p,--poll", pollId,
                       "Vote statistics for a single poll");
  statsCmd->add_option("--top", topN, "Number of top polls to list");

  int bits = 0;
  auto *targetCmd =
      app.add_subcommand("target", "Print the target for a difficulty");
  targetCmd->add_option("bits", bits, "Difficulty bits")->required();

  auto *voterHashCmd =
      app.add_subcommand("voter-hash", "Print the voter hash of an identifier");
  voterHashCmd->add_option("voter", voterId, "Voter identifier")->required();

  app.footer("Example:\n"
             "  hashvote -d /path/to/work-dir vote -p p1 -c yes -v alice\n"
             "  hashvote -d /path/to/work-dir result -p p1\n"
             "\n"
             "A default config.json is created in the work directory if it "
             "doesn't exist.\n");

  CLI11_PARSE(app, argc, argv);

  if (debugMode) {
    hv::logging::getRootLogger().setLevel(hv::logging::Level::DEBUG);
  }

  if (targetCmd->parsed()) {
    return runTarget(bits);
  }
  if (voterHashCmd->parsed()) {
    nlohmann::json j;
    j["voterHash"] = hv::utl::deriveVoterHash(voterId);
    printJson(j);
    return 0;
  }

  std::optional<int64_t> timestampUs;
  if (!timestamp.empty()) {
    auto parsed = hv::utl::parseIsoMicros(timestamp);
    if (!parsed) {
      return printError(hv::VoteAdmission::E_VALIDATION,
                        "Invalid timestamp: " + parsed.error().message);
    }
    timestampUs = parsed.value();
  }

  Context ctx;
  auto opened = openContext(workDir, debugMode, ctx);
  if (!opened) {
    return printError(opened.error().code, opened.error().message);
  }

  std::signal(SIGINT, signalHandler);

  if (voteCmd->parsed()) {
    return runVote(ctx, pollId, choice, voterId, timestampUs);
  }
  if (resultCmd->parsed()) {
    return runResult(ctx, pollId);
  }
  if (auditCmd->parsed()) {
    return runAudit(ctx, pollId);
  }
  if (verifyCmd->parsed()) {
    return runVerify(ctx, pollId);
  }
  if (statsCmd->parsed()) {
    return runStats(ctx, voteStats, pollId, topN);
  }
  return 0;
}
