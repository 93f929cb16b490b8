#include "Service.h"

namespace pl {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  if (thread_.joinable()) {
    isStopSet_ = true;
    waitCv_.notify_all();
    thread_.join();
  }
}

Service::Roe<void> Service::start() {
  if (isRunning_) {
    return Error(-1, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(-2, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (!isRunning_) {
    return;
  }

  log().info << "Stopping service";

  {
    std::lock_guard<std::mutex> lock(waitMutex_);
    isStopSet_ = true;
  }
  waitCv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }

  onStop();
  isRunning_ = false;

  log().info << "Service stopped";
}

Service::Roe<void> Service::run() {
  if (isRunning_) {
    return Error(-1, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(-2, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  isRunning_ = true;
  log().info << "Service running in current thread";
  runLoop();
  onStop();
  isRunning_ = false;
  log().info << "Service stopped (current thread)";
  return {};
}

bool Service::waitFor(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(waitMutex_);
  return !waitCv_.wait_for(lock, duration, [this] { return isStopSet_.load(); });
}

} // namespace pl
