#include "NonceSearcher.h"
#include "PowVerifier.h"

#include <stdexcept>
#include <thread>
#include <vector>

namespace hv {
namespace pow {

NonceSearcher::NonceSearcher() : NonceSearcher(Config{}) {}

NonceSearcher::NonceSearcher(const Config &config)
    : Module("hashvote.pow.searcher"), config_(config) {
  if (config_.workers == 0) {
    config_.workers = 1;
  }
  if (config_.checkInterval == 0) {
    config_.checkInterval = 1;
  }
}

std::optional<uint64_t>
NonceSearcher::search(const BlockFields &fields, int bits,
                      std::chrono::milliseconds timeout,
                      const CancelCheck &isCancelled) {
  lastAttempts_ = 0;
  auto target = computeTarget(bits);
  if (!target) {
    log().error << "Invalid search difficulty: " << target.error().message;
    return std::nullopt;
  }

  Shared shared;
  shared.target = target.value();
  shared.deadline = Clock::now() + timeout;
  shared.isCancelled = isCancelled ? &isCancelled : nullptr;
  shared.stride = config_.workers;

  auto started = Clock::now();
  if (config_.workers == 1) {
    runWorker(fields, 0, shared);
  } else {
    std::vector<std::thread> threads;
    threads.reserve(config_.workers);
    for (uint32_t w = 0; w < config_.workers; ++w) {
      threads.emplace_back([this, &fields, w, &shared]() {
        runWorker(fields, w, shared);
      });
    }
    for (auto &t : threads) {
      t.join();
    }
  }
  lastAttempts_ = shared.attempts;
  auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                       Clock::now() - started)
                       .count();

  if (shared.abort) {
    log().debug << "Search for " << bits << " bits gave up after "
                << lastAttempts_ << " attempts (" << elapsedMs << " ms)";
    return std::nullopt;
  }

  if (!shared.found) {
    log().warning << "Nonce space exhausted for " << bits << " bits";
    return std::nullopt;
  }
  uint64_t nonce = shared.best;
  if (!verify(fields, nonce, shared.target)) {
    log().error << "Candidate nonce " << nonce
                << " failed re-validation, discarding";
    return std::nullopt;
  }

  log().debug << "Found nonce " << nonce << " for " << bits << " bits after "
              << lastAttempts_ << " attempts (" << elapsedMs << " ms)";
  return nonce;
}

void NonceSearcher::runWorker(const BlockFields &fields, uint32_t worker,
                              Shared &shared) const {
  try {
    scan(fields, worker, shared);
  } catch (const std::exception &e) {
    log().error << "Search worker " << worker << " failed: " << e.what();
    shared.abort = true;
  }
}

void NonceSearcher::scan(const BlockFields &fields, uint32_t worker,
                         Shared &shared) const {
  BlockHasher hasher(fields);
  Digest digest;
  uint64_t local = 0;
  uint32_t sinceCheck = 0;

  for (uint64_t nonce = worker;; nonce += shared.stride) {
    if (nonce > shared.best.load(std::memory_order_relaxed)) {
      break;
    }

    if (++sinceCheck >= config_.checkInterval) {
      sinceCheck = 0;
      if (shared.abort.load(std::memory_order_relaxed)) {
        break;
      }
      if (Clock::now() >= shared.deadline ||
          (shared.isCancelled && (*shared.isCancelled)())) {
        shared.abort = true;
        break;
      }
    }

    hasher.digest(nonce, digest);
    ++local;
    if (meetsTarget(digest, shared.target)) {
      shared.found = true;
      uint64_t current = shared.best.load();
      while (nonce < current &&
             !shared.best.compare_exchange_weak(current, nonce)) {
      }
      break;
    }

    if (nonce > UINT64_MAX - shared.stride) {
      break;
    }
  }
  shared.attempts += local;
}

SearchTask::SearchTask(const NonceSearcher::Config &config,
                       const BlockFields &fields, int bits,
                       std::chrono::milliseconds timeout)
    : Service("hashvote.pow.task"), searcher_(config), fields_(fields),
      bits_(bits), timeout_(timeout) {}

SearchTask::~SearchTask() { stop(); }

Service::Roe<void> SearchTask::onStart() {
  if (!isValidBits(bits_)) {
    return Error(E_INVALID_BITS,
                 "Difficulty bits must be in [0, 256], got " +
                     std::to_string(bits_));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  result_.reset();
  return {};
}

void SearchTask::runLoop() {
  auto found = searcher_.search(fields_, bits_, timeout_,
                                [this]() { return isStopSet(); });
  std::lock_guard<std::mutex> lock(mutex_);
  result_ = found;
}

void SearchTask::onStop() {
  if (isStopSet()) {
    std::lock_guard<std::mutex> lock(mutex_);
    result_.reset();
  }
}

std::optional<uint64_t> SearchTask::waitForResult() {
  join();
  return getResult();
}

std::optional<uint64_t> SearchTask::getResult() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return result_;
}

} // namespace pow
} // namespace hv
