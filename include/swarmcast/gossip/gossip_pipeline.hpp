#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "swarmcast/core/types.hpp"
#include "swarmcast/gossip/identity.hpp"
#include "swarmcast/oracle/round_oracle.hpp"
#include "swarmcast/sink/gossip_sink.hpp"
#include "swarmcast/store/peer_store.hpp"
#include "swarmcast/wire/value.hpp"

namespace swarmcast {

struct GossipConfig {
  std::chrono::milliseconds poll_interval{std::chrono::seconds(150)};
  size_t max_batch{200};
  std::chrono::milliseconds stop_timeout{std::chrono::seconds(5)};
  std::optional<uint64_t> seed{};
};

using GossipRng = std::mt19937_64;

// Every Payload reachable from a decoded peer entry: the entry itself, the
// elements of a List, or the List values of a Mapping. Other shapes are
// ignored.
std::vector<wire::Payload> collect_payloads(const wire::Value& entry);

// 32 lowercase hex chars of xxh3-128 over "question-peer-round-action-dataset".
std::string gossip_id(std::string_view question,
                      std::string_view peer_id,
                      int64_t round,
                      std::string_view action,
                      std::string_view dataset);

// nullopt when the payload's environment state has no string "question".
std::optional<GossipMessage> make_gossip_message(const wire::Payload& payload,
                                                 const std::string& peer_id,
                                                 int64_t round,
                                                 const IIdentityResolver& resolver,
                                                 GossipRng& rng,
                                                 WallClock::time_point now);

struct GossipBatch {
  std::vector<GossipMessage> messages{};
  size_t payloads{0};
  size_t decode_failures{0};
  size_t skipped{0};
};

// Decodes every peer entry of `record`. A malformed entry is logged and
// counted; the remaining peers still contribute.
GossipBatch build_gossip(const RoundRecord& record,
                         int64_t round,
                         const IIdentityResolver& resolver,
                         GossipRng& rng,
                         WallClock::time_point now,
                         std::string_view poll_id = {});

// Uniform shuffle, then truncation to `max_batch`.
void sample_gossip(std::vector<GossipMessage>& messages, size_t max_batch, GossipRng& rng);

enum class PollOutcome {
  OracleFailed,
  StoreFailed,
  NoRecord,
  Empty,
  Published,
  PublishFailed,
};

const char* poll_outcome_name(PollOutcome outcome) noexcept;

enum class HealthStatus { Ok, NeverPolled, Stale };

const char* health_status_name(HealthStatus status) noexcept;

struct HealthReport {
  HealthStatus status{HealthStatus::NeverPolled};
  // Age of the last successful store poll; empty when there was none.
  std::optional<std::chrono::milliseconds> since_last_poll{};

  bool ok() const noexcept { return status == HealthStatus::Ok; }
};

inline constexpr std::chrono::minutes kDefaultMaxPollAge{5};

// Periodically republishes a bounded sample of the current round's peer
// payloads. Runs on its own thread between start() and stop(); poll_once()
// may also be driven directly when the thread is not running.
class GossipPipeline {
 public:
  GossipPipeline(IRoundOracle& oracle,
                 IPeerStore& store,
                 IGossipSink& sink,
                 const IIdentityResolver& resolver,
                 GossipConfig cfg);
  ~GossipPipeline();

  GossipPipeline(const GossipPipeline&) = delete;
  GossipPipeline& operator=(const GossipPipeline&) = delete;

  void start();

  // Signals the thread and waits up to stop_timeout for the current cycle to
  // finish. Returns false if the thread did not exit in time; the destructor
  // then waits for the cycle in flight.
  bool stop();

  bool running() const;

  PollOutcome poll_once();

  RoundStage cursor() const;
  std::optional<WallClock::time_point> last_polled() const;

  // Unhealthy when the store has never been polled or the last poll is older
  // than max_age.
  HealthReport health(WallClock::time_point now,
                      std::chrono::milliseconds max_age = kDefaultMaxPollAge) const;
  uint64_t cycles() const noexcept { return cycles_.load(std::memory_order_relaxed); }

 private:
  void poll_loop();
  std::string next_poll_id();
  void join_thread();

  IRoundOracle& oracle_;
  IPeerStore& store_;
  IGossipSink& sink_;
  const IIdentityResolver& resolver_;
  GossipConfig cfg_;
  GossipRng rng_;
  GossipRng poll_id_rng_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::thread thread_;
  bool started_{false};
  bool stopping_{false};
  bool exited_{false};

  RoundStage cursor_{};
  std::optional<WallClock::time_point> last_polled_{};
  std::atomic<uint64_t> cycles_{0};
};

}  // namespace swarmcast
