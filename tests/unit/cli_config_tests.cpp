#include <chrono>
#include <format>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "app/runtime_runner.hpp"
#include "swarmcast/core/error.hpp"
#include "swarmcast/core/log.hpp"

namespace {

using namespace std::chrono_literals;
using swarmcast::ErrorCode;
using swarmcast::app::Command;

struct Args {
  explicit Args(std::vector<std::string> a) : storage(std::move(a)) {
    for (auto& s : storage) {
      ptrs.push_back(s.data());
    }
  }
  int argc() const { return static_cast<int>(ptrs.size()); }
  char** argv() { return ptrs.data(); }

  std::vector<std::string> storage;
  std::vector<char*> ptrs;
};

swarmcast::app::EnvLookup env_of(std::map<std::string, std::string> vars) {
  return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
    const auto it = vars.find(name);
    if (it == vars.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

bool test_gossip_flags_and_env() {
  Args args({"swarmcast", "gossip", "--seed", "7", "--max-batch", "50", "--poll-interval-sec",
             "2.5", "--log-level", "debug"});
  const auto cfg = swarmcast::app::parse_args(
      args.argc(), args.argv(),
      env_of({{"SWARMCAST_PROXY_URL", "http://localhost:3000"},
              {"SWARMCAST_ORG_ID", "org"},
              {"SWARMCAST_STORE_DIR", "/tmp/store"}}));
  if (!cfg) {
    std::cerr << std::format("gossip parse failed: {}\n", cfg.error().message());
    return false;
  }
  if (cfg->command != Command::Gossip || cfg->proxy_url != "http://localhost:3000" ||
      cfg->org_id != "org" || cfg->store_dir != "/tmp/store") {
    std::cerr << std::format("environment fallbacks were not applied\n");
    return false;
  }
  if (cfg->gossip.seed != std::optional<uint64_t>(7) || cfg->gossip.max_batch != 50 ||
      cfg->gossip.poll_interval != 2500ms) {
    std::cerr << std::format("gossip flags mismatch\n");
    return false;
  }
  if (cfg->sink_path || cfg->log_level != swarmcast::LogLevel::Debug) {
    std::cerr << std::format("sink or log flags mismatch\n");
    return false;
  }
  return true;
}

bool test_flag_overrides_env() {
  Args args({"swarmcast", "gossip", "--proxy-url", "http://flag:1", "--store-dir", "/s",
             "--sink-path", "/tmp/events.jsonl"});
  const auto cfg = swarmcast::app::parse_args(
      args.argc(), args.argv(), env_of({{"SWARMCAST_PROXY_URL", "http://env:2"}}));
  if (!cfg || cfg->proxy_url != "http://flag:1" || !cfg->sink_path ||
      cfg->gossip.max_batch != 200 || cfg->gossip.poll_interval != 150s || cfg->gossip.seed) {
    std::cerr << std::format("flags should win over the environment\n");
    return false;
  }
  return true;
}

bool test_missing_settings() {
  Args no_proxy({"swarmcast", "gossip", "--store-dir", "/s"});
  const auto a = swarmcast::app::parse_args(no_proxy.argc(), no_proxy.argv(), env_of({}));
  if (a || a.error().code() != ErrorCode::ConfigurationError ||
      swarmcast::app::exit_code_for(a.error()) != swarmcast::app::kExitConfig) {
    std::cerr << std::format("missing proxy url should be a configuration error\n");
    return false;
  }

  Args no_store({"swarmcast", "gossip", "--proxy-url", "http://x"});
  const auto b = swarmcast::app::parse_args(no_store.argc(), no_store.argv(), env_of({}));
  if (b || b.error().code() != ErrorCode::ConfigurationError) {
    std::cerr << std::format("missing store dir should be a configuration error\n");
    return false;
  }

  Args bad_url({"swarmcast", "gossip", "--proxy-url", "ftp://x", "--store-dir", "/s"});
  const auto c = swarmcast::app::parse_args(bad_url.argc(), bad_url.argv(), env_of({}));
  if (c || swarmcast::app::exit_code_for(c.error()) != swarmcast::app::kExitConfig) {
    std::cerr << std::format("a non-http proxy url should be rejected\n");
    return false;
  }
  return true;
}

bool test_wait_round_and_decode() {
  Args wait({"swarmcast", "wait-round", "--proxy-url", "http://x", "--finished-round", "3",
             "--check-interval-sec", "2", "--max-check-interval-sec", "8", "--max-round", "10"});
  const auto w = swarmcast::app::parse_args(wait.argc(), wait.argv(), env_of({}));
  if (!w || w->command != Command::WaitRound || w->finished_round != 3 ||
      w->barrier.check_interval != 2s || w->barrier.max_check_interval != 8s ||
      w->barrier.max_round != 10 || w->barrier.log_timeout != 10s) {
    std::cerr << std::format("wait-round flags mismatch\n");
    return false;
  }

  Args bad_wait({"swarmcast", "wait-round", "--proxy-url", "http://x", "--finished-round", "3",
                 "--check-interval-sec", "9", "--max-check-interval-sec", "8"});
  if (swarmcast::app::parse_args(bad_wait.argc(), bad_wait.argv(), env_of({}))) {
    std::cerr << std::format("max check interval below check interval should fail\n");
    return false;
  }

  Args decode({"swarmcast", "decode", "entry.bin"});
  const auto d = swarmcast::app::parse_args(decode.argc(), decode.argv(), env_of({}));
  if (!d || d->command != Command::Decode || d->decode_input != "entry.bin") {
    std::cerr << std::format("decode needs no oracle settings\n");
    return false;
  }

  Args reg({"swarmcast", "register", "--proxy-url", "http://x", "--peer-id", "QmPeer"});
  const auto r = swarmcast::app::parse_args(reg.argc(), reg.argv(), env_of({}));
  return r && r->command == Command::Register && r->peer_id == "QmPeer";
}

bool test_log_levels() {
  const auto warn = swarmcast::parse_log_level("warning");
  const auto bad = swarmcast::parse_log_level("loud");
  if (!warn || *warn != swarmcast::LogLevel::Warn || bad) {
    std::cerr << std::format("log level parsing mismatch\n");
    return false;
  }

  std::vector<std::string> lines;
  swarmcast::set_log_hook(
      [&](swarmcast::LogLevel, std::string_view line) { lines.emplace_back(line); });
  swarmcast::set_log_level(swarmcast::LogLevel::Warn);
  swarmcast::log_info("hidden {}", 1);
  swarmcast::log_error("shown round={}", 4);
  swarmcast::set_log_hook({});
  swarmcast::set_log_level(swarmcast::LogLevel::Info);

  if (lines.size() != 1 || lines[0].find("shown round=4") == std::string::npos) {
    std::cerr << std::format("log filtering mismatch ({} lines)\n", lines.size());
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!test_gossip_flags_and_env()) {
    return 1;
  }
  if (!test_flag_overrides_env()) {
    return 1;
  }
  if (!test_missing_settings()) {
    return 1;
  }
  if (!test_wait_round_and_decode()) {
    return 1;
  }
  if (!test_log_levels()) {
    return 1;
  }
  return 0;
}
