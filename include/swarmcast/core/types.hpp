#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace swarmcast {

using Clock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

struct RoundStage {
  int64_t round{-1};
  int64_t stage{-1};

  bool operator==(const RoundStage&) const = default;
};

struct GossipMessage {
  std::string id{};
  std::string peer_id{};
  std::string peer_display_name{};
  std::string message{};
  WallClock::time_point timestamp{};
  std::optional<std::string> dataset{};
};

struct GossipEvent {
  std::string type{"gossip"};
  std::vector<GossipMessage> data{};
};

}  // namespace swarmcast
