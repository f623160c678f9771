#include <format>
#include <memory>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "oracle/http_client.hpp"
#include "swarmcast/core/error.hpp"
#include "swarmcast/core/log.hpp"
#include "swarmcast/oracle/round_oracle.hpp"

namespace swarmcast {
namespace {

using json = nlohmann::json;

constexpr int kStatusBadRequest = 400;
constexpr int kStatusConflict = 409;
constexpr std::string_view kAlreadyRegistered = "PeerIdAlreadyRegistered";

bool is_success(int status) { return status >= 200 && status < 300; }

std::string error_name(const std::string& body) {
  const auto parsed = json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return {};
  }
  const auto it = parsed.find("error");
  if (it == parsed.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

class HttpOracle final : public IRoundOracle {
 public:
  HttpOracle(std::string base_url,
             HttpOracleConfig cfg,
             std::unique_ptr<net::IHttpTransport> transport)
      : base_url_(std::move(base_url)), cfg_(std::move(cfg)), transport_(std::move(transport)) {}

  RoundStage query_round_and_stage() override {
    try {
      const auto resp = post("round-and-stage", json::object());
      if (!is_success(resp.status)) {
        throw Error{ErrorCode::OracleUnavailable,
                    std::format("round-and-stage returned status {}", resp.status)};
      }
      const auto body = json::parse(resp.body);
      RoundStage out{};
      out.round = body.at("round").get<int64_t>();
      out.stage = body.at("stage").get<int64_t>();
      return out;
    } catch (const Error& e) {
      if (e.code() == ErrorCode::OracleUnavailable) {
        throw;
      }
      throw Error{ErrorCode::OracleUnavailable, e.message()};
    } catch (const json::exception& e) {
      throw Error{ErrorCode::OracleUnavailable,
                  std::format("malformed round-and-stage response: {}", e.what())};
    }
  }

  void submit_reward(int64_t round,
                     int64_t stage,
                     int64_t amount,
                     const std::string& peer_id) override {
    const auto resp = post("submit-reward", json{{"roundNumber", round},
                                                 {"stageNumber", stage},
                                                 {"reward", amount},
                                                 {"peerId", peer_id}});
    check_submission("submit-reward", resp);
  }

  void submit_winners(int64_t round,
                      const std::vector<std::string>& winners,
                      const std::string& peer_id) override {
    const auto resp = post("submit-winner", json{{"roundNumber", round},
                                                 {"winners", winners},
                                                 {"peerId", peer_id}});
    check_submission("submit-winner", resp);
  }

  void register_peer(const std::string& peer_id) override {
    const auto resp = post("register-peer", json{{"peerId", peer_id}});
    if (is_success(resp.status)) {
      return;
    }
    if (resp.status == kStatusBadRequest) {
      const auto name = error_name(resp.body);
      if (name == kAlreadyRegistered) {
        log_info("peer already registered, continuing peer={}", peer_id);
        return;
      }
      throw Error{ErrorCode::TransportError,
                  std::format("register-peer rejected: {}",
                              name.empty() ? resp.body : name)};
    }
    throw Error{ErrorCode::TransportError,
                std::format("register-peer returned status {}", resp.status)};
  }

  std::vector<std::string> get_bootstrap_addresses() override {
    const auto resp = post("bootnodes", json::object());
    if (!is_success(resp.status)) {
      throw Error{ErrorCode::TransportError,
                  std::format("bootnodes returned status {}", resp.status)};
    }
    try {
      return json::parse(resp.body).at("bootnodes").get<std::vector<std::string>>();
    } catch (const json::exception& e) {
      throw Error{ErrorCode::TransportError,
                  std::format("malformed bootnodes response: {}", e.what())};
    }
  }

 private:
  net::HttpResponse post(std::string_view endpoint, json body) {
    body["orgId"] = cfg_.org_id;
    return transport_->post_json(std::format("{}/api/{}", base_url_, endpoint), body.dump(),
                                 cfg_.timeout);
  }

  static void check_submission(std::string_view endpoint, const net::HttpResponse& resp) {
    if (is_success(resp.status)) {
      return;
    }
    if (resp.status == kStatusConflict) {
      throw Error{ErrorCode::SubmissionConflict,
                  std::format("{} already recorded: {}", endpoint, resp.body)};
    }
    throw Error{ErrorCode::TransportError,
                std::format("{} returned status {}", endpoint, resp.status)};
  }

  std::string base_url_;
  HttpOracleConfig cfg_;
  std::unique_ptr<net::IHttpTransport> transport_;
};

}  // namespace

std::unique_ptr<IRoundOracle> make_http_oracle(const HttpOracleConfig& cfg,
                                               std::unique_ptr<net::IHttpTransport> transport) {
  if (cfg.base_url.empty()) {
    throw Error{ErrorCode::ConfigurationError, "oracle proxy url is not configured"};
  }
  auto url = net::normalize_base_url(cfg.base_url);
  if (!url) {
    throw url.error();
  }
  if (!transport) {
    throw Error{ErrorCode::InvalidArgument, "http transport is null"};
  }
  return std::make_unique<HttpOracle>(std::move(*url), cfg, std::move(transport));
}

std::unique_ptr<IRoundOracle> make_http_oracle(const HttpOracleConfig& cfg) {
  return make_http_oracle(cfg, net::make_curl_transport());
}

}  // namespace swarmcast
