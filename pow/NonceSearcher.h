#ifndef HASHVOTE_NONCE_SEARCHER_H
#define HASHVOTE_NONCE_SEARCHER_H

#include "BlockHasher.h"
#include "Difficulty.h"
#include "../lib/Module.h"
#include "../lib/Service.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>

namespace hv {
namespace pow {

/**
 * Brute force nonce search for a block.
 *
 * The scan starts at nonce 0 and is deterministic: with the same fields and
 * bits it always yields the smallest valid nonce, in sequential and in
 * parallel mode. Parallel mode interleaves the nonce space across workers
 * (worker w tries w, w+W, w+2W, ...). A worker stops once its next candidate
 * exceeds the best nonce found so far.
 *
 * Deadline expiry and cancellation both yield std::nullopt.
 */
class NonceSearcher : public Module {
public:
  struct Config {
    uint32_t workers{ 1 };
    // Attempts between deadline and cancellation checks
    uint32_t checkInterval{ 1024 };
  };

  using CancelCheck = std::function<bool()>;

  NonceSearcher();
  explicit NonceSearcher(const Config &config);
  ~NonceSearcher() override = default;

  const Config &getConfig() const { return config_; }

  /**
   * Search for a nonce satisfying `bits`
   * @param fields Block fields without the nonce
   * @param bits Leading zero bits, [0, 256]
   * @param timeout Hard deadline for the whole search
   * @param isCancelled Optional callback polled with the deadline
   * @return Smallest valid nonce, or std::nullopt on timeout, cancellation
   *         or invalid bits
   */
  std::optional<uint64_t> search(const BlockFields &fields, int bits,
                                 std::chrono::milliseconds timeout,
                                 const CancelCheck &isCancelled = nullptr);

  // Attempts made by the last search, summed over workers
  uint64_t getLastAttempts() const { return lastAttempts_; }

private:
  using Clock = std::chrono::steady_clock;

  struct Shared {
    Target target;
    Clock::time_point deadline;
    const CancelCheck *isCancelled{ nullptr };
    uint32_t stride{ 1 };
    std::atomic<uint64_t> best{ UINT64_MAX };
    std::atomic<bool> found{ false };
    std::atomic<bool> abort{ false };
    std::atomic<uint64_t> attempts{ 0 };
  };

  void runWorker(const BlockFields &fields, uint32_t worker,
                 Shared &shared) const;
  void scan(const BlockFields &fields, uint32_t worker, Shared &shared) const;

  Config config_;
  uint64_t lastAttempts_{ 0 };
};

/**
 * A nonce search running in the background.
 * stop() cancels the search and leaves no result behind.
 */
class SearchTask : public Service {
public:
  SearchTask(const NonceSearcher::Config &config, const BlockFields &fields,
             int bits, std::chrono::milliseconds timeout);
  ~SearchTask() override;

  /**
   * Wait for the search to finish on its own and return its outcome
   */
  std::optional<uint64_t> waitForResult();

  /**
   * Current outcome; std::nullopt while running, after cancellation or
   * when nothing was found
   */
  std::optional<uint64_t> getResult() const;

  const BlockFields &getFields() const { return fields_; }
  int getBits() const { return bits_; }

protected:
  void runLoop() override;
  Roe<void> onStart() override;
  void onStop() override;

private:
  NonceSearcher searcher_;
  BlockFields fields_;
  int bits_{ 0 };
  std::chrono::milliseconds timeout_;

  mutable std::mutex mutex_;
  std::optional<uint64_t> result_;
};

} // namespace pow
} // namespace hv

#endif // HASHVOTE_NONCE_SEARCHER_H
