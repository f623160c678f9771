#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "swarmcast/core/types.hpp"
#include "swarmcast/oracle/round_oracle.hpp"
#include "swarmcast/reward/submission_controller.hpp"
#include "swarmcast/round/round_barrier.hpp"

namespace swarmcast {

struct WorkResult {
  // Signal earned per agent this round; when present it takes precedence
  // over `signal` and also drives the winner designation.
  std::map<std::string, double> signal_by_agent{};
  double signal{0.0};
};

// One round of local work (training, evaluation, ...). Exceptions escape the
// peer loop.
class IWorkUnit {
 public:
  virtual ~IWorkUnit() = default;

  virtual WorkResult run_round(const RoundStage& at) = 0;
};

struct PeerLoopResult {
  BarrierState state{BarrierState::Polling};
  RoundStage cursor{};
  uint64_t rounds{0};
  uint64_t submitted{0};
  uint64_t abandoned{0};
  bool final_round{false};
};

// Registers the peer, then alternates work, reward accumulation, submission
// and the round barrier until the swarm reaches its final round, the barrier
// times out, or request_stop() is called.
class PeerLoop {
 public:
  PeerLoop(IRoundOracle& oracle, IWorkUnit& work, RoundBarrier& barrier, std::string peer_id);

  PeerLoopResult run();

  void request_stop() noexcept { stop_requested_.store(true, std::memory_order_relaxed); }

  const SubmissionController& controller() const noexcept { return controller_; }

 private:
  void settle_previous_round(const RoundStage& finished, PeerLoopResult& result);

  IRoundOracle& oracle_;
  IWorkUnit& work_;
  RoundBarrier& barrier_;
  SubmissionController controller_;
  std::atomic<bool> stop_requested_{false};
};

}  // namespace swarmcast
