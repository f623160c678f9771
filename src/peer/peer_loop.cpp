#include "swarmcast/peer/peer_loop.hpp"

#include <format>
#include <utility>

#include "swarmcast/core/error.hpp"
#include "swarmcast/core/log.hpp"

namespace swarmcast {

PeerLoop::PeerLoop(IRoundOracle& oracle,
                   IWorkUnit& work,
                   RoundBarrier& barrier,
                   std::string peer_id)
    : oracle_(oracle), work_(work), barrier_(barrier), controller_(oracle, std::move(peer_id)) {}

// Second chance for a submission that failed right after the work: once the
// swarm has moved on, a round that still cannot be submitted is abandoned so
// its reward does not leak into the next one.
void PeerLoop::settle_previous_round(const RoundStage& finished, PeerLoopResult& result) {
  if (controller_.is_closed(finished.round)) {
    return;
  }
  if (controller_.maybe_submit(finished.round, finished.stage) == SubmitStatus::Submitted) {
    ++result.submitted;
    return;
  }
  controller_.abandon(finished.round);
  ++result.abandoned;
}

PeerLoopResult PeerLoop::run() {
  const auto& peer = controller_.peer_id();
  PeerLoopResult result{};

  if (!barrier_.retry(std::format("register peer {}", peer),
                      [&] { oracle_.register_peer(peer); }) ||
      !barrier_.retry(std::format("fetch starting round for peer {}", peer),
                      [&] { result.cursor = oracle_.query_round_and_stage(); })) {
    result.state = BarrierState::TimedOut;
    return result;
  }
  log_info("peer {} starting at round={} stage={}", controller_.peer_id(), result.cursor.round,
           result.cursor.stage);

  while (!stop_requested_.load(std::memory_order_relaxed)) {
    const RoundStage at = result.cursor;
    controller_.begin_round(at.round);

    const auto work = work_.run_round(at);
    ++result.rounds;
    if (!work.signal_by_agent.empty()) {
      const auto mine = controller_.accumulate_from_agents(work.signal_by_agent);
      log_debug("round={} stage={} shaped_signal={}", at.round, at.stage, mine);
    } else {
      controller_.accumulate(work.signal);
    }

    const auto status = controller_.maybe_submit(at.round, at.stage);
    if (status == SubmitStatus::Submitted) {
      ++result.submitted;
    }

    auto cursor = at;
    const auto waited = barrier_.wait(cursor);
    result.state = waited.state;
    if (waited.state == BarrierState::TimedOut) {
      log_error("peer {} timed out waiting for round {}", controller_.peer_id(), at.round + 1);
      return result;
    }

    settle_previous_round(at, result);
    result.cursor = cursor;
    if (waited.final_round) {
      result.final_round = true;
      log_info("peer {} reached the final round={}", controller_.peer_id(), cursor.round);
      return result;
    }
  }

  log_info("peer {} stopping at round={} stage={}", controller_.peer_id(), result.cursor.round,
           result.cursor.stage);
  return result;
}

}  // namespace swarmcast
