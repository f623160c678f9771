#include "swarmcast/round/round_barrier.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

#include "swarmcast/core/error.hpp"
#include "swarmcast/core/log.hpp"

namespace swarmcast {
namespace {

double to_seconds(std::chrono::milliseconds d) {
  return std::chrono::duration<double>(d).count();
}

}  // namespace

const char* barrier_state_name(BarrierState state) noexcept {
  switch (state) {
    case BarrierState::Polling:
      return "polling";
    case BarrierState::Advanced:
      return "advanced";
    case BarrierState::TimedOut:
      return "timed_out";
  }
  return "unknown";
}

RoundBarrier::RoundBarrier(IRoundOracle& oracle, BarrierConfig cfg)
    : RoundBarrier(
          oracle, cfg, [] { return Clock::now(); },
          [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

RoundBarrier::RoundBarrier(IRoundOracle& oracle, BarrierConfig cfg, NowFn now, SleepFn sleep)
    : oracle_(oracle),
      cfg_(cfg),
      now_(std::move(now)),
      sleep_(std::move(sleep)),
      backoff_(cfg.check_interval) {
  if (cfg_.check_interval.count() <= 0) {
    throw Error{ErrorCode::InvalidArgument, "check_interval must be > 0"};
  }
  if (cfg_.max_check_interval < cfg_.check_interval) {
    throw Error{ErrorCode::InvalidArgument, "max_check_interval must be >= check_interval"};
  }
}

BarrierResult RoundBarrier::wait(RoundStage& cursor) {
  const auto start = now_();
  auto last_failure_log = start;
  const int64_t awaited = cursor.round + 1;
  backoff_ = cfg_.check_interval;

  BarrierResult result{};
  result.cursor = cursor;

  while (now_() - start < cfg_.overall_timeout) {
    const auto tick = now_();
    ++result.polls;

    RoundStage remote{};
    try {
      remote = oracle_.query_round_and_stage();
    } catch (const std::exception& e) {
      if (tick - last_failure_log > cfg_.log_timeout) {
        log_warn("could not fetch round and stage: {} awaiting={} next_check_s={}", e.what(),
                 awaited, to_seconds(cfg_.check_interval));
        last_failure_log = tick;
      }
      sleep_(cfg_.check_interval);
      continue;
    }

    const bool final_round = remote.round == cfg_.max_round - 1;
    if (remote.round >= awaited) {
      log_info("joining round={} stage={}", remote.round, remote.stage);
      cursor = remote;
      backoff_ = cfg_.check_interval;
      result.state = BarrierState::Advanced;
      result.cursor = cursor;
      result.final_round = final_round;
      return result;
    }
    if (final_round) {
      log_info("final round reached round={} stage={}", remote.round, remote.stage);
      backoff_ = cfg_.check_interval;
      result.state = BarrierState::Advanced;
      result.final_round = true;
      return result;
    }

    log_info("already finished round={} next_check_s={}", remote.round, to_seconds(backoff_));
    sleep_(backoff_);
    backoff_ = std::min(backoff_ * 2, cfg_.max_check_interval);
  }

  log_warn("round barrier timed out awaiting={} polls={}", awaited, result.polls);
  result.state = BarrierState::TimedOut;
  return result;
}

bool RoundBarrier::retry(std::string_view what, const std::function<void()>& call) {
  const auto start = now_();
  auto last_failure_log = start;
  uint64_t attempts = 0;

  while (now_() - start < cfg_.overall_timeout) {
    const auto tick = now_();
    ++attempts;
    try {
      call();
      return true;
    } catch (const std::exception& e) {
      if (attempts == 1 || tick - last_failure_log > cfg_.log_timeout) {
        log_warn("{} failed: {} attempts={} next_check_s={}", what, e.what(), attempts,
                 to_seconds(cfg_.check_interval));
        last_failure_log = tick;
      }
    }
    sleep_(cfg_.check_interval);
  }

  log_error("{} gave up after {} attempts", what, attempts);
  return false;
}

}  // namespace swarmcast
