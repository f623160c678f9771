#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "swarmcast/core/error.hpp"
#include "swarmcast/core/types.hpp"
#include "swarmcast/gossip/identity.hpp"
#include "swarmcast/oracle/round_oracle.hpp"
#include "swarmcast/sink/gossip_sink.hpp"
#include "swarmcast/store/peer_store.hpp"

namespace swarmcast::testing {

// Scripted oracle. Each query pops the next response; an empty optional in
// the script is an OracleUnavailable failure. Once the script runs out the
// last response repeats.
class FakeOracle final : public IRoundOracle {
 public:
  struct RewardCall {
    int64_t round{};
    int64_t stage{};
    int64_t amount{};
    std::string peer_id;
  };
  struct WinnersCall {
    int64_t round{};
    std::vector<std::string> winners;
    std::string peer_id;
  };

  void script(std::vector<std::optional<RoundStage>> responses) {
    std::scoped_lock lock(mu_);
    responses_.assign(responses.begin(), responses.end());
  }

  RoundStage query_round_and_stage() override {
    std::scoped_lock lock(mu_);
    ++queries;
    std::optional<RoundStage> next = last_;
    if (!responses_.empty()) {
      next = responses_.front();
      responses_.pop_front();
      last_ = next;
    }
    if (!next) {
      throw Error{ErrorCode::OracleUnavailable, "scripted oracle failure"};
    }
    return *next;
  }

  void submit_reward(int64_t round,
                     int64_t stage,
                     int64_t amount,
                     const std::string& peer_id) override {
    std::scoped_lock lock(mu_);
    if (fail_rewards > 0) {
      --fail_rewards;
      throw Error{ErrorCode::TransportError, "scripted reward failure"};
    }
    reward_calls.push_back(RewardCall{round, stage, amount, peer_id});
    if (conflict_rewards) {
      throw Error{ErrorCode::SubmissionConflict, "reward already recorded"};
    }
  }

  void submit_winners(int64_t round,
                      const std::vector<std::string>& winners,
                      const std::string& peer_id) override {
    std::scoped_lock lock(mu_);
    if (fail_winners > 0) {
      --fail_winners;
      throw Error{ErrorCode::TransportError, "scripted winners failure"};
    }
    winners_calls.push_back(WinnersCall{round, winners, peer_id});
  }

  void register_peer(const std::string& peer_id) override {
    std::scoped_lock lock(mu_);
    if (fail_register > 0) {
      --fail_register;
      throw Error{ErrorCode::TransportError, "scripted register failure"};
    }
    registered.push_back(peer_id);
  }

  std::vector<std::string> get_bootstrap_addresses() override { return {}; }

  uint64_t queries{0};
  int fail_rewards{0};
  int fail_winners{0};
  int fail_register{0};
  bool conflict_rewards{false};
  std::vector<RewardCall> reward_calls;
  std::vector<WinnersCall> winners_calls;
  std::vector<std::string> registered;

 private:
  std::mutex mu_;
  std::deque<std::optional<RoundStage>> responses_;
  std::optional<RoundStage> last_;
};

class FakeStore final : public IPeerStore {
 public:
  std::optional<RoundRecord> get(const std::string& key) override {
    std::scoped_lock lock(mu_);
    requested.push_back(key);
    if (fail) {
      throw Error{ErrorCode::TransportError, "scripted store failure"};
    }
    const auto it = records.find(key);
    if (it == records.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::map<std::string, RoundRecord> records;
  std::vector<std::string> requested;
  bool fail{false};

 private:
  std::mutex mu_;
};

class FakeSink final : public IGossipSink {
 public:
  void publish(const GossipEvent& event) override {
    std::scoped_lock lock(mu_);
    if (fail) {
      throw Error{ErrorCode::TransportError, "scripted sink failure"};
    }
    events.push_back(event);
  }

  std::vector<GossipEvent> snapshot() const {
    std::scoped_lock lock(mu_);
    return events;
  }

  std::vector<GossipEvent> events;
  bool fail{false};

 private:
  mutable std::mutex mu_;
};

class EchoResolver final : public IIdentityResolver {
 public:
  std::string display_name(std::string_view peer_id) const override {
    return "name-" + std::string(peer_id);
  }
};

// Manual clock for the barrier: sleeping advances time.
struct ManualTime {
  Clock::time_point now{Clock::time_point{} + std::chrono::hours(1)};
  std::vector<std::chrono::milliseconds> sleeps;

  auto now_fn() {
    return [this]() { return now; };
  }
  auto sleep_fn() {
    return [this](std::chrono::milliseconds d) {
      sleeps.push_back(d);
      now += d;
    };
  }
};

}  // namespace swarmcast::testing
