#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace pl {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Derived classes implement runLoop(), which executes in the service thread
 * (start) or in the caller thread (run) and should return once isStopSet().
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Service(const std::string &name);

  /**
   * Derived classes must call stop() in their own destructor; by the time
   * this one runs the derived runLoop() can no longer be executed safely.
   */
  ~Service() override;

  bool isRunning() const { return isRunning_; }
  bool isStopSet() const { return isStopSet_; }

  Roe<void> run();
  Roe<void> start();
  void stop();

protected:
  virtual void runLoop() = 0;

  virtual Roe<void> onStart() { return {}; }

  virtual void onStop() {}

  /**
   * Sleep up to the given duration, returning early when stop is requested.
   * @return false if stop was requested
   */
  bool waitFor(std::chrono::milliseconds duration);

private:
  std::atomic<bool> isStopSet_{ false };
  std::atomic<bool> isRunning_{ false };
  std::thread thread_;
  std::mutex waitMutex_;
  std::condition_variable waitCv_;
};

} // namespace pl
