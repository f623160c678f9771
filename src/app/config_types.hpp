#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "swarmcast/core/log.hpp"
#include "swarmcast/gossip/gossip_pipeline.hpp"
#include "swarmcast/round/round_barrier.hpp"

namespace swarmcast::app {

enum class Command { Gossip, WaitRound, Register, Decode };

inline constexpr int kExitOk = 0;
inline constexpr int kExitRuntime = 1;
inline constexpr int kExitConfig = 2;
inline constexpr int kExitTimeout = 4;

struct Config {
  Command command{Command::Gossip};
  LogLevel log_level{LogLevel::Info};

  std::string proxy_url;
  std::string org_id;
  std::chrono::milliseconds http_timeout{std::chrono::seconds(30)};

  std::filesystem::path store_dir;
  std::optional<std::filesystem::path> sink_path;

  GossipConfig gossip{};
  BarrierConfig barrier{};

  int64_t finished_round{-1};
  std::string peer_id;
  std::filesystem::path decode_input;
};

}  // namespace swarmcast::app
