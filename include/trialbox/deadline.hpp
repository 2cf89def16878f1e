#pragma once

// trialbox/deadline.hpp - Per-call cancellable deadline.
//
// Each tool call owns its own Deadline, so concurrent calls carry independent
// budgets. Long loops poll check() between units of work. cancel() may be
// called from any thread.

#include <atomic>
#include <chrono>
#include <string>

namespace trialbox {

class Deadline {
 public:
  using Clock = std::chrono::steady_clock;

  explicit Deadline(std::chrono::milliseconds budget)
      : budget_(budget), expires_at_(Clock::now() + budget) {}

  Deadline(const Deadline&) = delete;
  Deadline& operator=(const Deadline&) = delete;

  static constexpr std::chrono::milliseconds seconds(int s) {
    return std::chrono::milliseconds(static_cast<long long>(s) * 1000);
  }

  bool expired() const {
    return cancelled_.load(std::memory_order_acquire) || Clock::now() >= expires_at_;
  }

  void cancel() { cancelled_.store(true, std::memory_order_release); }

  // Throws Error(timeout) naming `operation` once the deadline has passed.
  void check(const std::string& operation) const;

  std::chrono::milliseconds budget() const { return budget_; }
  int budget_sec() const {
    return static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(budget_).count());
  }

 private:
  std::chrono::milliseconds budget_;
  Clock::time_point expires_at_;
  std::atomic<bool> cancelled_{false};
};

}  // namespace trialbox
