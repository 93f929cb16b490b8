#include "Module.h"
#include "Service.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace {

class TestModule : public pl::Module {
public:
  explicit TestModule(const std::string &name) : pl::Module(name) {}
};

class CountingService : public pl::Service {
public:
  CountingService() : pl::Service("test.counting") {}
  ~CountingService() override { stop(); }

  bool failStart{ false };
  std::atomic<int> iterations{ 0 };
  std::atomic<bool> stopped{ false };

protected:
  Roe<void> onStart() override {
    if (failStart) {
      return Error(7, "refused");
    }
    return {};
  }

  void onStop() override { stopped = true; }

  void runLoop() override {
    while (!isStopSet()) {
      ++iterations;
      if (!waitFor(std::chrono::milliseconds(5))) {
        break;
      }
    }
  }
};

} // namespace

TEST(ModuleTest, LogBindsToNamedLogger) {
  TestModule module("module_test.a");
  EXPECT_EQ(&module.log(), &pl::logging::getLogger("module_test.a"));
  EXPECT_EQ(module.getLoggerName(), "module_test.a");
  EXPECT_NO_THROW(module.log().info << "message");
}

TEST(ModuleTest, SetLoggerNameRebinds) {
  TestModule module("module_test.b");
  module.setLoggerName("module_test.b.t42");
  EXPECT_EQ(&module.log(), &pl::logging::getLogger("module_test.b.t42"));
}

TEST(ServiceTest, StartRunsLoopUntilStop) {
  CountingService service;
  ASSERT_TRUE(service.start().isOk());
  EXPECT_TRUE(service.isRunning());
  EXPECT_TRUE(service.start().isError());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (service.iterations.load() < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  service.stop();
  EXPECT_FALSE(service.isRunning());
  EXPECT_TRUE(service.stopped.load());
  EXPECT_GE(service.iterations.load(), 2);
}

TEST(ServiceTest, FailedOnStartLeavesServiceStopped) {
  CountingService service;
  service.failStart = true;
  auto result = service.start();
  ASSERT_TRUE(result.isError());
  EXPECT_NE(result.error().message.find("refused"), std::string::npos);
  EXPECT_FALSE(service.isRunning());
}
