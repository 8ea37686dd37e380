#ifndef HASHVOTE_SERVICE_H
#define HASHVOTE_SERVICE_H

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <thread>

namespace hv {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement the runLoop() method which executes in the service
 * thread or in the current thread when using run().
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_ALREADY_RUNNING = -1;
  constexpr static int32_t E_START = -2;

  explicit Service(const std::string &name);

  /**
   * Virtual destructor - waits for the service thread if it is still alive.
   * Derived classes must call stop() in their own destructor since runLoop()
   * is no longer callable once they are destroyed.
   */
  ~Service() override;

  bool isStopSet() const { return isStopSet_; }
  bool isRunning() const { return isRunning_; }

  Roe<void> run();
  Roe<void> start();

  /**
   * Request stop and wait for the service thread to finish
   */
  void stop();

  /**
   * Wait for runLoop() to return on its own, without requesting stop
   */
  void join();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Runs in the service thread or in the caller thread when using run().
   * Should check !isStopSet() periodically to allow graceful shutdown.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the thread starts (in the calling thread context).
   * Override to perform pre-start initialization.
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called after the thread has stopped (in the calling thread context).
   */
  virtual void onStop() {}

private:
  void threadMain();

  std::atomic<bool> isStopSet_{ false };
  std::atomic<bool> isRunning_{ false };
  std::thread thread_;
};

} // namespace hv

#endif // HASHVOTE_SERVICE_H
