#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "swarmcast/core/types.hpp"

namespace swarmcast {

// Ledger-backed source of truth for the training schedule. Every call may
// throw Error; query failures carry ErrorCode::OracleUnavailable.
class IRoundOracle {
 public:
  virtual ~IRoundOracle() = default;

  virtual RoundStage query_round_and_stage() = 0;

  // Throws Error{SubmissionConflict} when the ledger already holds the entry.
  virtual void submit_reward(int64_t round,
                             int64_t stage,
                             int64_t amount,
                             const std::string& peer_id) = 0;
  virtual void submit_winners(int64_t round,
                              const std::vector<std::string>& winners,
                              const std::string& peer_id) = 0;

  // Succeeds when the peer is already registered.
  virtual void register_peer(const std::string& peer_id) = 0;

  virtual std::vector<std::string> get_bootstrap_addresses() = 0;
};

struct HttpOracleConfig {
  std::string base_url{};
  std::string org_id{};
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

std::unique_ptr<IRoundOracle> make_http_oracle(const HttpOracleConfig& cfg);

}  // namespace swarmcast
