#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

#include "swarmcast/core/types.hpp"
#include "swarmcast/oracle/round_oracle.hpp"

namespace swarmcast {

enum class BarrierState { Polling, Advanced, TimedOut };

const char* barrier_state_name(BarrierState state) noexcept;

struct BarrierConfig {
  std::chrono::milliseconds check_interval{std::chrono::seconds(5)};
  std::chrono::milliseconds log_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds max_check_interval{std::chrono::minutes(15)};
  std::chrono::milliseconds overall_timeout{std::chrono::days(31)};
  int64_t max_round{1'000'000};
};

struct BarrierResult {
  BarrierState state{BarrierState::Polling};
  RoundStage cursor{};
  // The oracle reported max_round - 1; the caller should stop asking for rounds.
  bool final_round{false};
  uint64_t polls{0};
};

// Waits for the swarm to move past the round a peer has just finished. There
// is no push channel, so the oracle is polled: oracle failures are retried at
// check_interval, a swarm that is still behind is retried with exponential
// backoff capped at max_check_interval.
class RoundBarrier {
 public:
  using NowFn = std::function<Clock::time_point()>;
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  RoundBarrier(IRoundOracle& oracle, BarrierConfig cfg);
  RoundBarrier(IRoundOracle& oracle, BarrierConfig cfg, NowFn now, SleepFn sleep);

  // `cursor.round` is the last round this peer finished. On Advanced the
  // cursor takes the oracle's (round, stage); otherwise it is left unchanged.
  BarrierResult wait(RoundStage& cursor);

  // Runs `call` until it returns normally, sleeping check_interval after each
  // failure and logging at most once per log_timeout. Returns false once
  // overall_timeout has elapsed without a success.
  bool retry(std::string_view what, const std::function<void()>& call);

  std::chrono::milliseconds current_backoff() const noexcept { return backoff_; }
  const BarrierConfig& config() const noexcept { return cfg_; }

 private:
  IRoundOracle& oracle_;
  BarrierConfig cfg_;
  NowFn now_;
  SleepFn sleep_;
  std::chrono::milliseconds backoff_;
};

}  // namespace swarmcast
