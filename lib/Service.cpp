#include "Service.h"

namespace hv {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  if (thread_.joinable()) {
    isStopSet_ = true;
    thread_.join();
  }
}

Service::Roe<void> Service::start() {
  if (isRunning_ || thread_.joinable()) {
    return Error(E_ALREADY_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_START,
                 "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  thread_ = std::thread(&Service::threadMain, this);

  log().debug << "Service started";
  return {};
}

void Service::threadMain() {
  runLoop();
  isRunning_ = false;
}

void Service::stop() {
  if (!thread_.joinable()) {
    return;
  }

  log().debug << "Stopping service";
  isStopSet_ = true;
  thread_.join();
  onStop();
  log().debug << "Service stopped";
}

void Service::join() {
  if (!thread_.joinable()) {
    return;
  }
  thread_.join();
  onStop();
}

Service::Roe<void> Service::run() {
  if (isRunning_ || thread_.joinable()) {
    return Error(E_ALREADY_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_START,
                 "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  log().debug << "Service running in current thread";
  runLoop();
  isRunning_ = false;
  onStop();
  return {};
}

} // namespace hv
