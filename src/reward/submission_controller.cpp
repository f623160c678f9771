#include "swarmcast/reward/submission_controller.hpp"

#include <cmath>
#include <cstdint>
#include <exception>
#include <limits>
#include <utility>
#include <vector>

#include "swarmcast/core/error.hpp"
#include "swarmcast/core/log.hpp"

namespace swarmcast {
namespace {

// Positive signal earns a participation bonus of one.
double shape_signal(double signal) { return signal > 0.0 ? signal + 1.0 : signal; }

template <class Fn>
void call_tolerating_conflict(std::string_view what, int64_t round, Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    if (e.code() != ErrorCode::SubmissionConflict) {
      throw;
    }
    log_info("{} already recorded by ledger round={}: {}", what, round, e.what());
  }
}

// Truncates toward zero, saturating outside the int64 range.
int64_t to_reward_amount(double accumulated) {
  constexpr double kTwoPow63 = 9223372036854775808.0;
  if (accumulated >= kTwoPow63) {
    return std::numeric_limits<int64_t>::max();
  }
  if (accumulated < -kTwoPow63) {
    return std::numeric_limits<int64_t>::min();
  }
  return static_cast<int64_t>(accumulated);
}

}  // namespace

const char* submit_status_name(SubmitStatus status) noexcept {
  switch (status) {
    case SubmitStatus::Submitted:
      return "submitted";
    case SubmitStatus::AlreadySubmitted:
      return "already_submitted";
    case SubmitStatus::Abandoned:
      return "abandoned";
    case SubmitStatus::Failed:
      return "failed";
  }
  return "unknown";
}

SubmissionController::SubmissionController(IRoundOracle& oracle, std::string peer_id)
    : oracle_(oracle), peer_id_(std::move(peer_id)) {
  if (peer_id_.empty()) {
    throw Error{ErrorCode::InvalidArgument, "peer_id must not be empty"};
  }
}

void SubmissionController::accumulate(double signal) {
  if (!std::isfinite(signal)) {
    log_warn("ignoring non-finite signal peer={} value={}", peer_id_, signal);
    return;
  }
  accumulator_ += signal;
}

double SubmissionController::accumulate_from_agents(
    const std::map<std::string, double>& signal_by_agent) {
  agent_signals_ = signal_by_agent;
  if (signal_by_agent.empty()) {
    return 0.0;
  }
  const auto it = signal_by_agent.find(peer_id_);
  const double mine = shape_signal(it == signal_by_agent.end() ? 0.0 : it->second);
  accumulate(mine);
  return mine;
}

std::string SubmissionController::winner() const {
  if (agent_signals_.empty()) {
    return peer_id_;
  }
  auto best = agent_signals_.begin();
  for (auto it = agent_signals_.begin(); it != agent_signals_.end(); ++it) {
    if (it->second > best->second) {
      best = it;
    }
  }
  return best->first;
}

bool SubmissionController::is_closed(int64_t round) const {
  return closed_rounds_.contains(round);
}

SubmitStatus SubmissionController::maybe_submit(int64_t round, int64_t stage) {
  if (const auto it = closed_rounds_.find(round); it != closed_rounds_.end()) {
    return it->second == SubmitStatus::Abandoned ? SubmitStatus::Abandoned
                                                 : SubmitStatus::AlreadySubmitted;
  }

  const auto amount = to_reward_amount(accumulator_);
  const auto chosen = winner();
  try {
    if (reward_recorded_round_ != round) {
      call_tolerating_conflict("reward", round, [&] {
        oracle_.submit_reward(round, stage, amount, peer_id_);
      });
      reward_recorded_round_ = round;
    }
    call_tolerating_conflict("winners", round, [&] {
      oracle_.submit_winners(round, std::vector<std::string>{chosen}, peer_id_);
    });
  } catch (const std::exception& e) {
    log_warn("reward submission failed round={} stage={} peer={}: {}", round, stage, peer_id_,
             e.what());
    return SubmitStatus::Failed;
  }

  log_info("submitted reward round={} stage={} reward={} winner={}", round, stage, amount,
           chosen);
  closed_rounds_.emplace(round, SubmitStatus::Submitted);
  reward_recorded_round_.reset();
  accumulator_ = 0.0;
  return SubmitStatus::Submitted;
}

void SubmissionController::abandon(int64_t round) {
  if (closed_rounds_.contains(round)) {
    return;
  }
  log_warn("abandoning reward submission round={} pending_reward={}", round, accumulator_);
  closed_rounds_.emplace(round, SubmitStatus::Abandoned);
  if (reward_recorded_round_ == round) {
    reward_recorded_round_.reset();
  }
  accumulator_ = 0.0;
}

void SubmissionController::begin_round(int64_t round) {
  if (round == current_round_) {
    return;
  }
  current_round_ = round;
  agent_signals_.clear();
}

}  // namespace swarmcast
