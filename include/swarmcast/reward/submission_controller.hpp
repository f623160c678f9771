#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "swarmcast/oracle/round_oracle.hpp"

namespace swarmcast {

enum class SubmitStatus {
  Submitted,
  AlreadySubmitted,
  Abandoned,
  Failed,
};

const char* submit_status_name(SubmitStatus status) noexcept;

// Owns the per-round reward accumulator of one peer. Submits at most once per
// round: a round is closed only by a recorded local success (or abandon), and
// a closed round never reaches the ledger again. Not thread-safe; it belongs
// to the peer loop.
class SubmissionController {
 public:
  SubmissionController(IRoundOracle& oracle, std::string peer_id);

  void accumulate(double signal);

  // Adds this peer's shaped signal from a per-agent map and remembers the map
  // for the winner designation. Returns the amount added.
  double accumulate_from_agents(const std::map<std::string, double>& signal_by_agent);

  SubmitStatus maybe_submit(int64_t round, int64_t stage);

  // Gives up on `round`: the accumulator is zeroed and the round is closed.
  void abandon(int64_t round);

  // Forgets the agent signals of the previous round.
  void begin_round(int64_t round);

  double accumulated() const noexcept { return accumulator_; }
  bool is_closed(int64_t round) const;
  std::string winner() const;
  const std::string& peer_id() const noexcept { return peer_id_; }

 private:
  IRoundOracle& oracle_;
  std::string peer_id_;
  double accumulator_{0.0};
  std::map<std::string, double> agent_signals_;
  std::map<int64_t, SubmitStatus> closed_rounds_;
  // Round whose reward call was accepted while the winner call is pending.
  std::optional<int64_t> reward_recorded_round_;
  int64_t current_round_{-1};
};

}  // namespace swarmcast
