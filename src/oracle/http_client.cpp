#include "oracle/http_client.hpp"

#include <format>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "swarmcast/core/error.hpp"

namespace swarmcast::net {
namespace {

constexpr size_t kMaxResponseBytes = 8 * 1024 * 1024;

struct EasyDeleter {
  void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

struct WriteCtx {
  std::string* out;
  bool overflow{false};
};

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<WriteCtx*>(userdata);
  const size_t total = size * nmemb;
  if (ctx->out->size() + total > kMaxResponseBytes) {
    ctx->overflow = true;
    return 0;
  }
  ctx->out->append(ptr, total);
  return total;
}

void init_curl_once() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw Error{ErrorCode::TransportError, "curl_global_init failed"};
    }
  });
}

void set_opt_checked(CURLcode rc, const char* what) {
  if (rc != CURLE_OK) {
    throw Error{ErrorCode::TransportError,
                std::format("curl option {}: {}", what, curl_easy_strerror(rc))};
  }
}

class CurlTransport final : public IHttpTransport {
 public:
  CurlTransport() { init_curl_once(); }

  HttpResponse post_json(const std::string& url,
                         const std::string& body,
                         std::chrono::milliseconds timeout) override {
    EasyHandle curl(curl_easy_init());
    if (!curl) {
      throw Error{ErrorCode::TransportError, "curl_easy_init failed"};
    }

    HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"));
    if (!headers || curl_slist_append(headers.get(), "Accept: application/json") == nullptr) {
      throw Error{ErrorCode::TransportError, "cannot build request headers"};
    }

    HttpResponse out{};
    WriteCtx ctx{&out.body};
    CURL* h = curl.get();
    set_opt_checked(curl_easy_setopt(h, CURLOPT_URL, url.c_str()), "url");
    set_opt_checked(curl_easy_setopt(h, CURLOPT_POST, 1L), "post");
    set_opt_checked(curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data()), "postfields");
    set_opt_checked(curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                                     static_cast<curl_off_t>(body.size())),
                    "postfieldsize");
    set_opt_checked(curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get()), "httpheader");
    set_opt_checked(curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count())),
                    "timeout");
    set_opt_checked(curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L), "nosignal");
    set_opt_checked(curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_body), "writefunction");
    set_opt_checked(curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx), "writedata");

    const CURLcode rc = curl_easy_perform(h);
    if (ctx.overflow) {
      throw Error{ErrorCode::TransportError, std::format("{}: response exceeds size limit", url)};
    }
    if (rc == CURLE_OPERATION_TIMEDOUT) {
      throw Error{ErrorCode::Timeout, std::format("{}: {}", url, curl_easy_strerror(rc))};
    }
    if (rc != CURLE_OK) {
      throw Error{ErrorCode::TransportError, std::format("{}: {}", url, curl_easy_strerror(rc))};
    }
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &out.status);
    return out;
  }
};

}  // namespace

std::unique_ptr<IHttpTransport> make_curl_transport() {
  return std::make_unique<CurlTransport>();
}

Expected<std::string> normalize_base_url(std::string_view url) {
  const bool http = url.starts_with("http://");
  const bool https = url.starts_with("https://");
  if (!http && !https) {
    return unexpected<Error>(Error{ErrorCode::ConfigurationError,
                                   std::format("only http(s) urls are supported: {}", url)});
  }
  while (url.ends_with('/')) {
    url.remove_suffix(1);
  }
  const auto host_start = url.find("://") + 3;
  if (url.size() <= host_start || url[host_start] == '/' || url[host_start] == ':') {
    return unexpected<Error>(Error{ErrorCode::ConfigurationError, "url has no host"});
  }
  return std::string(url);
}

}  // namespace swarmcast::net
