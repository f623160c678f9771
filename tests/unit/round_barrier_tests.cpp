#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "swarmcast/core/error.hpp"
#include "swarmcast/core/log.hpp"
#include "swarmcast/round/round_barrier.hpp"
#include "test_fakes.hpp"

namespace {

using namespace std::chrono_literals;
using swarmcast::BarrierConfig;
using swarmcast::BarrierState;
using swarmcast::RoundBarrier;
using swarmcast::RoundStage;
using swarmcast::testing::FakeOracle;
using swarmcast::testing::ManualTime;

BarrierConfig test_config() {
  BarrierConfig cfg{};
  cfg.check_interval = 5s;
  cfg.log_timeout = 10s;
  cfg.max_check_interval = 60s;
  cfg.overall_timeout = std::chrono::hours(1);
  cfg.max_round = 100;
  return cfg;
}

bool test_monotonic_advance() {
  FakeOracle oracle;
  oracle.script({RoundStage{0, 0}, RoundStage{0, 0}, RoundStage{1, 0}, RoundStage{1, 1}});
  ManualTime t;
  RoundBarrier barrier(oracle, test_config(), t.now_fn(), t.sleep_fn());

  RoundStage cursor{0, 0};
  const auto res = barrier.wait(cursor);
  if (res.state != BarrierState::Advanced || res.final_round) {
    std::cerr << std::format("expected advanced, got {}\n",
                             swarmcast::barrier_state_name(res.state));
    return false;
  }
  if (oracle.queries != 3 || res.polls != 3) {
    std::cerr << std::format("expected return after third response, queries={}\n",
                             oracle.queries);
    return false;
  }
  if (cursor.round != 1 || cursor.stage != 0 || !(res.cursor == cursor)) {
    std::cerr << std::format("cursor should be (1,0), got ({},{})\n", cursor.round,
                             cursor.stage);
    return false;
  }
  if (barrier.current_backoff() != 5s) {
    std::cerr << std::format("backoff should reset after advancing\n");
    return false;
  }
  return true;
}

bool test_backoff_growth_is_capped() {
  FakeOracle oracle;
  oracle.script({RoundStage{3, 0}});
  ManualTime t;
  auto cfg = test_config();
  cfg.overall_timeout = 10min;
  RoundBarrier barrier(oracle, cfg, t.now_fn(), t.sleep_fn());

  RoundStage cursor{3, 0};
  const auto res = barrier.wait(cursor);
  if (res.state != BarrierState::TimedOut) {
    std::cerr << std::format("always-behind oracle must time out\n");
    return false;
  }
  if (!(cursor == RoundStage{3, 0})) {
    std::cerr << std::format("timeout must leave the cursor unchanged\n");
    return false;
  }

  const std::vector<std::chrono::milliseconds> head{5s, 10s, 20s, 40s, 60s, 60s};
  if (t.sleeps.size() < head.size()) {
    std::cerr << std::format("too few sleeps: {}\n", t.sleeps.size());
    return false;
  }
  for (size_t i = 0; i < t.sleeps.size(); ++i) {
    const auto want = i < head.size() ? head[i] : 60000ms;
    if (t.sleeps[i] != want) {
      std::cerr << std::format("sleep {} was {} ms, want {} ms\n", i, t.sleeps[i].count(),
                               want.count());
      return false;
    }
  }
  return true;
}

bool test_failures_keep_backoff_and_rate_limit_logs() {
  FakeOracle oracle;
  std::vector<std::optional<RoundStage>> script(12, std::nullopt);
  script.push_back(RoundStage{5, 2});
  oracle.script(script);

  std::vector<std::string> warnings;
  swarmcast::set_log_hook([&](swarmcast::LogLevel level, std::string_view line) {
    if (level == swarmcast::LogLevel::Warn) {
      warnings.emplace_back(line);
    }
  });

  ManualTime t;
  RoundBarrier barrier(oracle, test_config(), t.now_fn(), t.sleep_fn());
  RoundStage cursor{4, 1};
  const auto res = barrier.wait(cursor);
  swarmcast::set_log_hook({});

  if (res.state != BarrierState::Advanced || !(cursor == RoundStage{5, 2})) {
    std::cerr << std::format("expected advance to (5,2)\n");
    return false;
  }
  for (size_t i = 0; i < 12; ++i) {
    if (t.sleeps[i] != 5s) {
      std::cerr << std::format("failure sleep {} should be check_interval\n", i);
      return false;
    }
  }
  // 12 failures 5s apart: a diagnostic at most every 10s of failing.
  if (warnings.empty() || warnings.size() > 6) {
    std::cerr << std::format("unexpected diagnostic count {}\n", warnings.size());
    return false;
  }
  return true;
}

bool test_reused_barrier_starts_from_check_interval() {
  FakeOracle oracle;
  oracle.script({RoundStage{3, 0}});
  ManualTime t;
  auto cfg = test_config();
  cfg.overall_timeout = 10min;
  RoundBarrier barrier(oracle, cfg, t.now_fn(), t.sleep_fn());

  RoundStage cursor{3, 0};
  if (barrier.wait(cursor).state != BarrierState::TimedOut ||
      barrier.current_backoff() != 60s) {
    std::cerr << std::format("first wait should time out at the capped backoff\n");
    return false;
  }

  t.sleeps.clear();
  oracle.script({RoundStage{3, 0}, RoundStage{4, 0}});
  const auto res = barrier.wait(cursor);
  if (res.state != BarrierState::Advanced || t.sleeps != std::vector{5000ms}) {
    std::cerr << std::format("second wait should sleep check_interval once, slept {} times\n",
                             t.sleeps.size());
    return false;
  }
  return true;
}

bool test_final_round() {
  FakeOracle oracle;
  oracle.script({RoundStage{99, 0}});
  ManualTime t;
  RoundBarrier barrier(oracle, test_config(), t.now_fn(), t.sleep_fn());

  RoundStage cursor{98, 3};
  const auto res = barrier.wait(cursor);
  if (res.state != BarrierState::Advanced || !res.final_round || cursor.round != 99) {
    std::cerr << std::format("max_round - 1 should be a final advance\n");
    return false;
  }

  // Reported even when this peer already finished that round.
  FakeOracle same;
  same.script({RoundStage{99, 1}});
  RoundBarrier again(same, test_config(), t.now_fn(), t.sleep_fn());
  RoundStage done{99, 1};
  const auto res2 = again.wait(done);
  if (res2.state != BarrierState::Advanced || !res2.final_round || same.queries != 1) {
    std::cerr << std::format("final round must end the wait immediately\n");
    return false;
  }
  return true;
}

bool test_invalid_config() {
  FakeOracle oracle;
  auto cfg = test_config();
  cfg.max_check_interval = 1s;
  try {
    RoundBarrier barrier(oracle, cfg);
  } catch (const swarmcast::Error& e) {
    return e.code() == swarmcast::ErrorCode::InvalidArgument;
  }
  std::cerr << std::format("max_check_interval < check_interval should be rejected\n");
  return false;
}

}  // namespace

int main() {
  if (!test_monotonic_advance()) {
    return 1;
  }
  if (!test_backoff_growth_is_capped()) {
    return 1;
  }
  if (!test_failures_keep_backoff_and_rate_limit_logs()) {
    return 1;
  }
  if (!test_reused_barrier_starts_from_check_interval()) {
    return 1;
  }
  if (!test_final_round()) {
    return 1;
  }
  if (!test_invalid_config()) {
    return 1;
  }
  return 0;
}
