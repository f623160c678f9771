#include "app/runtime_runner.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <time.h>

#include <argparse/argparse.hpp>

#include "swarmcast/core/error.hpp"
#include "swarmcast/core/log.hpp"
#include "swarmcast/gossip/gossip_pipeline.hpp"
#include "swarmcast/gossip/identity.hpp"
#include "swarmcast/oracle/round_oracle.hpp"
#include "swarmcast/round/round_barrier.hpp"
#include "swarmcast/sink/gossip_sink.hpp"
#include "swarmcast/store/peer_store.hpp"
#include "swarmcast/wire/codec.hpp"
#include "swarmcast/wire/value_json.hpp"

namespace {

using swarmcast::Error;
using swarmcast::ErrorCode;
using swarmcast::app::Command;
using swarmcast::app::Config;
using swarmcast::app::EnvLookup;

template <class T>
using Result = swarmcast::Expected<T>;

swarmcast::unexpected<Error> config_error(std::string message) {
  return swarmcast::unexpected<Error>(Error{ErrorCode::ConfigurationError, std::move(message)});
}

std::chrono::milliseconds seconds_flag(const argparse::ArgumentParser& cmd, const char* name) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::duration<double>(cmd.get<double>(name)));
}

void add_common_args(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--proxy-url")
      .default_value(std::string(""))
      .help("ledger proxy base URL (env SWARMCAST_PROXY_URL)");
  cmd.add_argument("--org-id")
      .default_value(std::string(""))
      .help("organisation id sent with every ledger call (env SWARMCAST_ORG_ID)");
  cmd.add_argument("--http-timeout-sec").scan<'g', double>().default_value(30.0);
  cmd.add_argument("--log-level").default_value(std::string("info"));
}

void add_barrier_args(argparse::ArgumentParser& cmd) {
  const swarmcast::BarrierConfig d{};
  auto secs = [](std::chrono::milliseconds ms) {
    return std::chrono::duration<double>(ms).count();
  };
  cmd.add_argument("--check-interval-sec")
      .scan<'g', double>()
      .default_value(secs(d.check_interval));
  cmd.add_argument("--log-timeout-sec").scan<'g', double>().default_value(secs(d.log_timeout));
  cmd.add_argument("--max-check-interval-sec")
      .scan<'g', double>()
      .default_value(secs(d.max_check_interval));
  cmd.add_argument("--timeout-sec").scan<'g', double>().default_value(secs(d.overall_timeout));
  cmd.add_argument("--max-round").scan<'i', int64_t>().default_value(d.max_round);
}

std::string flag_or_env(const argparse::ArgumentParser& cmd,
                        const char* flag,
                        const EnvLookup& env,
                        const char* var) {
  auto v = cmd.get<std::string>(flag);
  if (v.empty()) {
    if (auto e = env(var)) {
      v = *e;
    }
  }
  return v;
}

Result<void> read_common(const argparse::ArgumentParser& cmd, const EnvLookup& env, Config& cfg) {
  auto level = swarmcast::parse_log_level(cmd.get<std::string>("--log-level"));
  if (!level) {
    return swarmcast::unexpected<Error>(level.error());
  }
  cfg.log_level = *level;
  cfg.proxy_url = flag_or_env(cmd, "--proxy-url", env, "SWARMCAST_PROXY_URL");
  cfg.org_id = flag_or_env(cmd, "--org-id", env, "SWARMCAST_ORG_ID");
  cfg.http_timeout = seconds_flag(cmd, "--http-timeout-sec");
  return {};
}

void read_gossip(const argparse::ArgumentParser& cmd, const EnvLookup& env, Config& cfg) {
  cfg.gossip.poll_interval = seconds_flag(cmd, "--poll-interval-sec");
  cfg.gossip.max_batch = cmd.get<size_t>("--max-batch");
  cfg.gossip.stop_timeout = seconds_flag(cmd, "--stop-timeout-sec");
  if (auto seed = cmd.present<uint64_t>("--seed")) {
    cfg.gossip.seed = *seed;
  }

  cfg.store_dir = flag_or_env(cmd, "--store-dir", env, "SWARMCAST_STORE_DIR");
  const auto sink = flag_or_env(cmd, "--sink-path", env, "SWARMCAST_SINK_PATH");
  if (!sink.empty()) {
    cfg.sink_path = std::filesystem::path(sink);
  }
}

void read_barrier(const argparse::ArgumentParser& cmd, Config& cfg) {
  cfg.barrier.check_interval = seconds_flag(cmd, "--check-interval-sec");
  cfg.barrier.log_timeout = seconds_flag(cmd, "--log-timeout-sec");
  cfg.barrier.max_check_interval = seconds_flag(cmd, "--max-check-interval-sec");
  cfg.barrier.overall_timeout = seconds_flag(cmd, "--timeout-sec");
  cfg.barrier.max_round = cmd.get<int64_t>("--max-round");
}

std::unique_ptr<swarmcast::IRoundOracle> make_oracle(const Config& cfg) {
  swarmcast::HttpOracleConfig oc{};
  oc.base_url = cfg.proxy_url;
  oc.org_id = cfg.org_id;
  oc.timeout = cfg.http_timeout;
  return swarmcast::make_http_oracle(oc);
}

std::unique_ptr<swarmcast::IGossipSink> make_sink(const Config& cfg) {
  if (!cfg.sink_path) {
    swarmcast::log_warn("no sink path configured, gossip publishing is disabled");
    return swarmcast::make_null_sink();
  }
  swarmcast::FileSinkConfig sc{};
  sc.path = *cfg.sink_path;
  return swarmcast::make_file_sink(sc);
}

// Blocks SIGINT/SIGTERM for the calling thread and the threads it starts
// afterwards, so the signals are only ever consumed by sigtimedwait.
sigset_t block_stop_signals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  if (const int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr); rc != 0) {
    throw Error{ErrorCode::Internal, std::format("pthread_sigmask failed: {}", rc)};
  }
  return set;
}

int run_gossip(const Config& cfg) {
  auto oracle = make_oracle(cfg);
  auto store = swarmcast::make_directory_store(cfg.store_dir);
  auto sink = make_sink(cfg);
  auto resolver = swarmcast::make_hashed_name_resolver();

  const auto signals = block_stop_signals();
  swarmcast::GossipPipeline pipeline(*oracle, *store, *sink, *resolver, cfg.gossip);
  pipeline.start();

  // Between signals, report the pipeline's health once a minute.
  const timespec health_period{60, 0};
  auto last_health = swarmcast::HealthStatus::Ok;
  for (;;) {
    const int sig = sigtimedwait(&signals, nullptr, &health_period);
    if (sig > 0) {
      swarmcast::log_info("received signal {}, stopping", sig);
      break;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno != EAGAIN) {
      swarmcast::log_error("sigtimedwait failed: {}", std::strerror(errno));
      break;
    }
    const auto report = pipeline.health(swarmcast::WallClock::now());
    if (!report.ok()) {
      swarmcast::log_warn("gossip pipeline unhealthy: {}",
                          swarmcast::health_status_name(report.status));
    } else if (last_health != swarmcast::HealthStatus::Ok) {
      swarmcast::log_info("gossip pipeline healthy again");
    }
    last_health = report.status;
  }

  if (!pipeline.stop()) {
    return swarmcast::app::kExitRuntime;
  }
  return swarmcast::app::kExitOk;
}

int run_wait_round(const Config& cfg) {
  auto oracle = make_oracle(cfg);
  swarmcast::RoundBarrier barrier(*oracle, cfg.barrier);

  swarmcast::RoundStage cursor{};
  cursor.round = cfg.finished_round;
  const auto result = barrier.wait(cursor);
  if (result.state == swarmcast::BarrierState::TimedOut) {
    std::cerr << std::format("timed out waiting for round {} after {} polls\n",
                             cfg.finished_round + 1, result.polls);
    return swarmcast::app::kExitTimeout;
  }
  std::cout << std::format("round={} stage={} final_round={}\n", result.cursor.round,
                           result.cursor.stage, result.final_round);
  return swarmcast::app::kExitOk;
}

int run_register(const Config& cfg) {
  auto oracle = make_oracle(cfg);
  oracle->register_peer(cfg.peer_id);
  std::cout << std::format("registered peer {}\n", cfg.peer_id);

  try {
    for (const auto& addr : oracle->get_bootstrap_addresses()) {
      std::cout << addr << "\n";
    }
  } catch (const Error& e) {
    swarmcast::log_warn("could not fetch bootstrap addresses: {}", e.what());
  }
  return swarmcast::app::kExitOk;
}

int run_decode(const Config& cfg) {
  std::ifstream in(cfg.decode_input, std::ios::binary);
  if (!in.is_open()) {
    throw Error{ErrorCode::IoError, std::format("cannot open {}", cfg.decode_input.string())};
  }
  const std::vector<char> raw{std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>()};
  const auto bytes = std::as_bytes(std::span(raw));

  const auto decoded = swarmcast::wire::decode_prefix(bytes);
  if (decoded.consumed < bytes.size()) {
    swarmcast::log_info("ignoring {} trailing bytes", bytes.size() - decoded.consumed);
  }
  std::cout << swarmcast::wire::dump_json(decoded.value, 2) << "\n";
  return swarmcast::app::kExitOk;
}

int run_command(const Config& cfg) {
  switch (cfg.command) {
    case Command::Gossip:
      return run_gossip(cfg);
    case Command::WaitRound:
      return run_wait_round(cfg);
    case Command::Register:
      return run_register(cfg);
    case Command::Decode:
      return run_decode(cfg);
  }
  return swarmcast::app::kExitRuntime;
}

}  // namespace

namespace swarmcast::app {

std::optional<std::string> process_env(const char* name) {
  const char* v = std::getenv(name);
  if (v == nullptr || *v == '\0') {
    return std::nullopt;
  }
  return std::string(v);
}

swarmcast::Expected<Config> parse_args(int argc, char** argv, const EnvLookup& env) {
  Config cfg{};

  argparse::ArgumentParser program("swarmcast");

  argparse::ArgumentParser gossip_cmd("gossip");
  gossip_cmd.add_description("republish sampled peer payloads until SIGINT/SIGTERM");
  add_common_args(gossip_cmd);
  gossip_cmd.add_argument("--poll-interval-sec").scan<'g', double>().default_value(150.0);
  gossip_cmd.add_argument("--max-batch").scan<'u', size_t>().default_value(size_t{200});
  gossip_cmd.add_argument("--stop-timeout-sec").scan<'g', double>().default_value(5.0);
  gossip_cmd.add_argument("--seed").scan<'u', uint64_t>();
  gossip_cmd.add_argument("--store-dir")
      .default_value(std::string(""))
      .help("peer store mirror directory (env SWARMCAST_STORE_DIR)");
  gossip_cmd.add_argument("--sink-path")
      .default_value(std::string(""))
      .help("event output file (env SWARMCAST_SINK_PATH); unset disables publishing");

  argparse::ArgumentParser wait_cmd("wait-round");
  wait_cmd.add_description("block until the swarm moves past a finished round");
  add_common_args(wait_cmd);
  add_barrier_args(wait_cmd);
  wait_cmd.add_argument("--finished-round").scan<'i', int64_t>().required();

  argparse::ArgumentParser register_cmd("register");
  register_cmd.add_description("register a peer and print the bootstrap addresses");
  add_common_args(register_cmd);
  register_cmd.add_argument("--peer-id").required();

  argparse::ArgumentParser decode_cmd("decode");
  decode_cmd.add_description("decode a wire-format file and print it as JSON");
  decode_cmd.add_argument("file");
  decode_cmd.add_argument("--log-level").default_value(std::string("info"));

  program.add_subparser(gossip_cmd);
  program.add_subparser(wait_cmd);
  program.add_subparser(register_cmd);
  program.add_subparser(decode_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return swarmcast::unexpected<Error>(
        Error{ErrorCode::InvalidArgument, "argument parsing failed"});
  }

  if (program.is_subcommand_used(gossip_cmd)) {
    cfg.command = Command::Gossip;
    if (auto ok = read_common(gossip_cmd, env, cfg); !ok) {
      return swarmcast::unexpected<Error>(ok.error());
    }
    read_gossip(gossip_cmd, env, cfg);
  } else if (program.is_subcommand_used(wait_cmd)) {
    cfg.command = Command::WaitRound;
    if (auto ok = read_common(wait_cmd, env, cfg); !ok) {
      return swarmcast::unexpected<Error>(ok.error());
    }
    read_barrier(wait_cmd, cfg);
    cfg.finished_round = wait_cmd.get<int64_t>("--finished-round");
  } else if (program.is_subcommand_used(register_cmd)) {
    cfg.command = Command::Register;
    if (auto ok = read_common(register_cmd, env, cfg); !ok) {
      return swarmcast::unexpected<Error>(ok.error());
    }
    cfg.peer_id = register_cmd.get<std::string>("--peer-id");
  } else if (program.is_subcommand_used(decode_cmd)) {
    cfg.command = Command::Decode;
    auto level = swarmcast::parse_log_level(decode_cmd.get<std::string>("--log-level"));
    if (!level) {
      return swarmcast::unexpected<Error>(level.error());
    }
    cfg.log_level = *level;
    cfg.decode_input = decode_cmd.get<std::string>("file");
  } else {
    std::cerr << program;
    return swarmcast::unexpected<Error>(Error{ErrorCode::InvalidArgument, "no command given"});
  }

  if (auto ok = validate_config(cfg); !ok) {
    return swarmcast::unexpected<Error>(ok.error());
  }
  return cfg;
}

swarmcast::Expected<void> validate_config(const Config& cfg) {
  if (cfg.command != Command::Decode && cfg.proxy_url.empty()) {
    return config_error(
        "ledger proxy URL is not configured (--proxy-url or SWARMCAST_PROXY_URL)");
  }
  if (cfg.command != Command::Decode && !cfg.proxy_url.starts_with("http://") &&
      !cfg.proxy_url.starts_with("https://")) {
    return config_error(std::format("ledger proxy URL must be http(s): {}", cfg.proxy_url));
  }
  switch (cfg.command) {
    case Command::Gossip:
      if (cfg.store_dir.empty()) {
        return config_error("peer store directory is not configured "
                            "(--store-dir or SWARMCAST_STORE_DIR)");
      }
      if (cfg.gossip.poll_interval.count() <= 0) {
        return config_error("--poll-interval-sec must be > 0");
      }
      if (cfg.gossip.max_batch == 0) {
        return config_error("--max-batch must be > 0");
      }
      break;
    case Command::WaitRound:
      if (cfg.barrier.check_interval.count() <= 0 ||
          cfg.barrier.max_check_interval < cfg.barrier.check_interval) {
        return config_error("barrier intervals must satisfy 0 < check <= max check");
      }
      if (cfg.finished_round < -1) {
        return config_error("--finished-round must be >= -1");
      }
      break;
    case Command::Register:
      if (cfg.peer_id.empty()) {
        return config_error("--peer-id must not be empty");
      }
      break;
    case Command::Decode:
      break;
  }
  return {};
}

int exit_code_for(const Error& e) noexcept {
  switch (e.code()) {
    case ErrorCode::ConfigurationError:
    case ErrorCode::InvalidArgument:
      return kExitConfig;
    default:
      return kExitRuntime;
  }
}

}  // namespace swarmcast::app

int run_cli_impl(int argc, char** argv) {
  auto cfg = swarmcast::app::parse_args(argc, argv, swarmcast::app::process_env);
  if (!cfg) {
    std::cerr << "error: " << cfg.error().message() << "\n";
    return swarmcast::app::exit_code_for(cfg.error());
  }
  swarmcast::set_log_level(cfg->log_level);

  try {
    return run_command(*cfg);
  } catch (const Error& e) {
    std::cerr << std::format("error: {} ({})\n", e.message(),
                             swarmcast::error_code_name(e.code()));
    return swarmcast::app::exit_code_for(e);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return swarmcast::app::kExitRuntime;
  }
}
