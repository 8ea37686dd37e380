#include "Module.h"
#include "Service.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

class TestModule : public hv::Module {
public:
  explicit TestModule(const std::string &name) : hv::Module(name) {}
};

TEST(ModuleTest, LogReturnsNamedLogger) {
  TestModule module("module_test.component");
  EXPECT_NO_THROW(module.log().info << "Test message");
  EXPECT_EQ(module.log().getName(), "component");
  EXPECT_EQ(module.log().getFullName(), "module_test.component");
}

TEST(ModuleTest, LogIsConst) {
  const TestModule module("module_const");
  EXPECT_NO_THROW(module.log().info << "Const test message");
  EXPECT_EQ(module.log().getName(), "module_const");
}

TEST(ModuleTest, RedirectLoggerReparents) {
  TestModule module("module_redirect");
  module.redirectLogger("module_owner");
  EXPECT_EQ(module.log().getParent(), hv::logging::getLogger("module_owner"));
  EXPECT_EQ(module.log().getFullName(), "module_owner.module_redirect");
}

namespace {

class CountingService : public hv::Service {
public:
  CountingService() : hv::Service("service_test") {}
  ~CountingService() override { stop(); }

  std::atomic<int> iterations{ 0 };
  std::atomic<int> limit{ -1 };
  bool stopped{ false };

protected:
  void runLoop() override {
    while (!isStopSet()) {
      if (limit >= 0 && iterations >= limit) {
        return;
      }
      ++iterations;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  void onStop() override { stopped = true; }
};

class FailingService : public hv::Service {
public:
  FailingService() : hv::Service("service_failing") {}

protected:
  void runLoop() override {}
  Roe<void> onStart() override { return Error(7, "not ready"); }
};

} // namespace

TEST(ServiceTest, StartAndStop) {
  CountingService service;
  ASSERT_TRUE(service.start().isOk());
  EXPECT_TRUE(service.isRunning());

  auto again = service.start();
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, hv::Service::E_ALREADY_RUNNING);

  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  service.stop();
  EXPECT_TRUE(service.isStopSet());
  EXPECT_FALSE(service.isRunning());
  EXPECT_TRUE(service.stopped);
  EXPECT_GT(service.iterations.load(), 0);
}

TEST(ServiceTest, JoinWaitsForLoopToFinish) {
  CountingService service;
  service.limit = 3;
  ASSERT_TRUE(service.start().isOk());
  service.join();
  EXPECT_FALSE(service.isRunning());
  EXPECT_FALSE(service.isStopSet());
  EXPECT_EQ(service.iterations.load(), 3);
}

TEST(ServiceTest, RunExecutesInCallerThread) {
  CountingService service;
  service.limit = 2;
  ASSERT_TRUE(service.run().isOk());
  EXPECT_EQ(service.iterations.load(), 2);
  EXPECT_TRUE(service.stopped);
}

TEST(ServiceTest, OnStartFailureAbortsStart) {
  FailingService service;
  auto result = service.start();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, hv::Service::E_START);
  EXPECT_FALSE(service.isRunning());
}
