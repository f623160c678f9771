#include "swarmcast/gossip/gossip_pipeline.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

#include <xxhash.h>

#include "swarmcast/core/error.hpp"
#include "swarmcast/core/log.hpp"
#include "swarmcast/wire/codec.hpp"
#include "swarmcast/wire/value_json.hpp"

namespace swarmcast {
namespace {

void append_payloads(const wire::Value& v, std::vector<wire::Payload>& out) {
  if (v.is_payload()) {
    out.push_back(v.as_payload());
    return;
  }
  if (v.is_list()) {
    for (const auto& item : v.as_list()) {
      if (item.is_payload()) {
        out.push_back(item.as_payload());
      }
    }
  }
}

const wire::Value* environment_states(const wire::Payload& payload) {
  if (!payload.world_state.is_world_state()) {
    return nullptr;
  }
  return &payload.world_state.as_world_state().environment_states;
}

std::optional<std::string> source_dataset(const wire::Value& env) {
  const auto* meta = env.find("metadata");
  if (meta == nullptr) {
    return std::nullopt;
  }
  const auto* ds = meta->find("source_dataset");
  if (ds == nullptr || ds->is_none()) {
    return std::nullopt;
  }
  return wire::display_text(*ds);
}

std::string choose_action(const wire::Value& actions, GossipRng& rng) {
  if (actions.is_none()) {
    return {};
  }
  if (!actions.is_list()) {
    return wire::display_text(actions);
  }
  const auto& items = actions.as_list();
  if (items.empty()) {
    return {};
  }
  std::uniform_int_distribution<size_t> pick(0, items.size() - 1);
  return wire::display_text(items[pick(rng)]);
}

uint64_t initial_seed(const GossipConfig& cfg) {
  if (cfg.seed) {
    return *cfg.seed;
  }
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

}  // namespace

std::vector<wire::Payload> collect_payloads(const wire::Value& entry) {
  std::vector<wire::Payload> out;
  if (entry.is_mapping()) {
    for (const auto& [key, value] : entry.as_mapping()) {
      append_payloads(value, out);
    }
  } else {
    append_payloads(entry, out);
  }
  return out;
}

std::string gossip_id(std::string_view question,
                      std::string_view peer_id,
                      int64_t round,
                      std::string_view action,
                      std::string_view dataset) {
  const auto key = std::format("{}-{}-{}-{}-{}", question, peer_id, round, action, dataset);
  const XXH128_hash_t h = XXH3_128bits(key.data(), key.size());
  return std::format("{:016x}{:016x}", h.high64, h.low64);
}

std::optional<GossipMessage> make_gossip_message(const wire::Payload& payload,
                                                 const std::string& peer_id,
                                                 int64_t round,
                                                 const IIdentityResolver& resolver,
                                                 GossipRng& rng,
                                                 WallClock::time_point now) {
  const auto* env = environment_states(payload);
  if (env == nullptr) {
    return std::nullopt;
  }
  const auto* question = env->find("question");
  if (question == nullptr || !question->is_string()) {
    return std::nullopt;
  }

  const auto action = choose_action(payload.actions, rng);
  auto dataset = source_dataset(*env);

  GossipMessage msg{};
  msg.id = gossip_id(question->as_string(), peer_id, round, action, dataset.value_or(""));
  msg.peer_id = peer_id;
  msg.peer_display_name = resolver.display_name(peer_id);
  msg.message = std::format("{}...{}", question->as_string(), action);
  msg.timestamp = now;
  msg.dataset = std::move(dataset);
  return msg;
}

GossipBatch build_gossip(const RoundRecord& record,
                         int64_t round,
                         const IIdentityResolver& resolver,
                         GossipRng& rng,
                         WallClock::time_point now,
                         std::string_view poll_id) {
  GossipBatch batch{};
  for (const auto& [peer_id, bytes] : record) {
    wire::Value entry;
    try {
      entry = wire::decode(bytes);
    } catch (const Error& e) {
      if (!is_decode_error(e.code())) {
        throw;
      }
      ++batch.decode_failures;
      log_warn("gossip: skipping undecodable entry round={} peer={} poll_id={} code={}: {}",
               round, peer_id, poll_id, error_code_name(e.code()), e.what());
      continue;
    }

    for (const auto& payload : collect_payloads(entry)) {
      ++batch.payloads;
      auto msg = make_gossip_message(payload, peer_id, round, resolver, rng, now);
      if (!msg) {
        ++batch.skipped;
        continue;
      }
      batch.messages.push_back(std::move(*msg));
    }
  }
  return batch;
}

void sample_gossip(std::vector<GossipMessage>& messages, size_t max_batch, GossipRng& rng) {
  std::shuffle(messages.begin(), messages.end(), rng);
  if (messages.size() > max_batch) {
    messages.resize(max_batch);
  }
}

const char* poll_outcome_name(PollOutcome outcome) noexcept {
  switch (outcome) {
    case PollOutcome::OracleFailed:
      return "oracle_failed";
    case PollOutcome::StoreFailed:
      return "store_failed";
    case PollOutcome::NoRecord:
      return "no_record";
    case PollOutcome::Empty:
      return "empty";
    case PollOutcome::Published:
      return "published";
    case PollOutcome::PublishFailed:
      return "publish_failed";
  }
  return "unknown";
}

const char* health_status_name(HealthStatus status) noexcept {
  switch (status) {
    case HealthStatus::Ok:
      return "ok";
    case HealthStatus::NeverPolled:
      return "never polled";
    case HealthStatus::Stale:
      return "last poll too old";
  }
  return "unknown";
}

GossipPipeline::GossipPipeline(IRoundOracle& oracle,
                               IPeerStore& store,
                               IGossipSink& sink,
                               const IIdentityResolver& resolver,
                               GossipConfig cfg)
    : oracle_(oracle),
      store_(store),
      sink_(sink),
      resolver_(resolver),
      cfg_(cfg),
      rng_(initial_seed(cfg)),
      poll_id_rng_(std::random_device{}()) {
  if (cfg_.poll_interval.count() <= 0) {
    throw Error{ErrorCode::InvalidArgument, "poll_interval must be > 0"};
  }
  if (cfg_.max_batch == 0) {
    throw Error{ErrorCode::InvalidArgument, "max_batch must be > 0"};
  }
}

GossipPipeline::~GossipPipeline() {
  {
    std::scoped_lock lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  join_thread();
}

void GossipPipeline::start() {
  std::scoped_lock lock(mu_);
  if (started_) {
    log_warn("gossip pipeline is already running");
    return;
  }
  if (thread_.joinable()) {
    throw Error{ErrorCode::Unsupported, "previous gossip cycle has not finished"};
  }
  started_ = true;
  stopping_ = false;
  exited_ = false;
  thread_ = std::thread([this]() { this->poll_loop(); });
  log_info("gossip pipeline started interval_s={} max_batch={}",
           std::chrono::duration<double>(cfg_.poll_interval).count(), cfg_.max_batch);
}

bool GossipPipeline::stop() {
  {
    std::unique_lock lock(mu_);
    if (!started_) {
      log_warn("gossip pipeline is not running");
      return true;
    }
    stopping_ = true;
    cv_.notify_all();
    if (!cv_.wait_for(lock, cfg_.stop_timeout, [this]() { return exited_; })) {
      log_warn("gossip pipeline did not stop within {} ms", cfg_.stop_timeout.count());
      return false;
    }
    started_ = false;
  }
  join_thread();
  log_info("gossip pipeline stopped cycles={}", cycles());
  return true;
}

bool GossipPipeline::running() const {
  std::scoped_lock lock(mu_);
  return started_ && !exited_;
}

RoundStage GossipPipeline::cursor() const {
  std::scoped_lock lock(mu_);
  return cursor_;
}

std::optional<WallClock::time_point> GossipPipeline::last_polled() const {
  std::scoped_lock lock(mu_);
  return last_polled_;
}

HealthReport GossipPipeline::health(WallClock::time_point now,
                                    std::chrono::milliseconds max_age) const {
  const auto polled = last_polled();
  HealthReport report{};
  if (!polled) {
    report.status = HealthStatus::NeverPolled;
    return report;
  }
  report.since_last_poll = std::chrono::duration_cast<std::chrono::milliseconds>(now - *polled);
  report.status = *report.since_last_poll > max_age ? HealthStatus::Stale : HealthStatus::Ok;
  return report;
}

void GossipPipeline::join_thread() {
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

std::string GossipPipeline::next_poll_id() { return std::format("{:016x}", poll_id_rng_()); }

PollOutcome GossipPipeline::poll_once() {
  const auto poll_id = next_poll_id();
  cycles_.fetch_add(1, std::memory_order_relaxed);

  RoundStage remote{};
  try {
    remote = oracle_.query_round_and_stage();
  } catch (const std::exception& e) {
    log_warn("gossip: could not fetch round and stage poll_id={}: {}", poll_id, e.what());
    return PollOutcome::OracleFailed;
  }

  {
    std::scoped_lock lock(mu_);
    if (remote != cursor_) {
      log_info("gossip: round/stage changed round={} stage={} previous_round={} "
               "previous_stage={} poll_id={}",
               remote.round, remote.stage, cursor_.round, cursor_.stage, poll_id);
      cursor_ = remote;
    }
  }

  std::optional<RoundRecord> record;
  try {
    record = store_.get(round_key(remote.round));
  } catch (const Error& e) {
    if (is_transient(e.code())) {
      log_warn("gossip: store lookup failed round={} stage={} poll_id={}: {}", remote.round,
               remote.stage, poll_id, e.what());
    } else {
      log_error("gossip: store lookup failed round={} stage={} poll_id={} code={}: {}",
                remote.round, remote.stage, poll_id, error_code_name(e.code()), e.what());
    }
    return PollOutcome::StoreFailed;
  } catch (const std::exception& e) {
    log_error("gossip: store lookup failed round={} stage={} poll_id={}: {}", remote.round,
              remote.stage, poll_id, e.what());
    return PollOutcome::StoreFailed;
  }
  if (!record || record->empty()) {
    log_info("gossip: no gossip found round={} stage={} poll_id={}", remote.round, remote.stage,
             poll_id);
    return PollOutcome::NoRecord;
  }

  const auto now = WallClock::now();
  {
    std::scoped_lock lock(mu_);
    last_polled_ = now;
  }

  auto batch = build_gossip(*record, remote.round, resolver_, rng_, now, poll_id);
  log_info("gossip: got gossip messages round={} stage={} peers={} payloads={} messages={} "
           "skipped={} decode_failures={} poll_id={}",
           remote.round, remote.stage, record->size(), batch.payloads, batch.messages.size(),
           batch.skipped, batch.decode_failures, poll_id);

  if (batch.messages.empty()) {
    log_info("gossip: no gossip data to publish poll_id={}", poll_id);
    return PollOutcome::Empty;
  }

  sample_gossip(batch.messages, cfg_.max_batch, rng_);

  GossipEvent event{};
  event.data = std::move(batch.messages);
  try {
    sink_.publish(event);
  } catch (const std::exception& e) {
    log_error("gossip: publish failed round={} stage={} messages={} poll_id={}: {}",
              remote.round, remote.stage, event.data.size(), poll_id, e.what());
    return PollOutcome::PublishFailed;
  }
  log_info("gossip: published messages={} round={} stage={} poll_id={}", event.data.size(),
           remote.round, remote.stage, poll_id);
  return PollOutcome::Published;
}

void GossipPipeline::poll_loop() {
  for (;;) {
    {
      std::scoped_lock lock(mu_);
      if (stopping_) {
        break;
      }
    }

    try {
      const auto outcome = poll_once();
      log_debug("gossip: cycle finished outcome={}", poll_outcome_name(outcome));
    } catch (const std::exception& e) {
      log_error("gossip: cycle failed: {}", e.what());
    }

    std::unique_lock lock(mu_);
    if (cv_.wait_for(lock, cfg_.poll_interval, [this]() { return stopping_; })) {
      break;
    }
  }

  {
    std::scoped_lock lock(mu_);
    exited_ = true;
  }
  cv_.notify_all();
}

}  // namespace swarmcast
