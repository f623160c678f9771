#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "swarmcast/core/expected.hpp"
#include "swarmcast/oracle/round_oracle.hpp"

namespace swarmcast::net {

struct HttpResponse {
  long status{0};
  std::string body{};
};

class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  // Throws Error{Timeout} when the deadline passes and Error{TransportError}
  // for every other failure to complete the exchange. HTTP error statuses
  // are returned, not thrown.
  virtual HttpResponse post_json(const std::string& url,
                                 const std::string& body,
                                 std::chrono::milliseconds timeout) = 0;
};

std::unique_ptr<IHttpTransport> make_curl_transport();

// Accepts http:// and https:// urls; trailing slashes are dropped.
Expected<std::string> normalize_base_url(std::string_view url);

}  // namespace swarmcast::net

namespace swarmcast {

std::unique_ptr<IRoundOracle> make_http_oracle(const HttpOracleConfig& cfg,
                                               std::unique_ptr<net::IHttpTransport> transport);

}  // namespace swarmcast
