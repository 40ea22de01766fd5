#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "tiermem/common.hpp"

namespace tiermem {

// Runs `sweep` every `interval_s` seconds on a worker thread until stopped.
class ExpirySweeper {
 public:
  using Callback = std::function<std::size_t()>;

  ExpirySweeper(Callback sweep, int interval_s) : sweep_(std::move(sweep)), interval_s_(interval_s) {}

  ~ExpirySweeper() { stop(); }

  ExpirySweeper(const ExpirySweeper&) = delete;
  ExpirySweeper& operator=(const ExpirySweeper&) = delete;

  bool start() {
    if (interval_s_ <= 0 || !sweep_ || running_.exchange(true)) {
      return false;
    }
    worker_ = std::thread([this]() { loop(); });
    return true;
  }

  void stop() {
    if (!running_.exchange(false)) {
      return;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool running() const { return running_.load(); }

  std::size_t sweep_now() { return sweep_ ? sweep_() : 0; }

 private:
  void loop() {
    while (running_.load()) {
      std::unique_lock<std::mutex> lock(wait_mu_);
      const bool stopped =
          cv_.wait_for(lock, std::chrono::seconds(interval_s_), [this]() { return !running_.load(); });
      lock.unlock();

      if (stopped || !running_.load()) {
        break;
      }

      try {
        const std::size_t removed = sweep_();
        if (removed > 0) {
          Logger::log(Logger::Level::kDebug, "sweeper: removed " + std::to_string(removed) + " expired items");
        }
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, std::string("sweeper: sweep failed: ") + e.what());
      }
    }
  }

  Callback sweep_;
  int interval_s_;
  std::atomic<bool> running_{false};
  std::thread worker_;
  std::mutex wait_mu_;
  std::condition_variable cv_;
};

}  // namespace tiermem
