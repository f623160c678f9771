#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <fstream>
#include <mutex>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "swarmcast/core/error.hpp"
#include "swarmcast/core/log.hpp"
#include "swarmcast/sink/gossip_sink.hpp"

namespace swarmcast {
namespace {

using json = nlohmann::json;

std::string format_timestamp(WallClock::time_point tp) {
  return std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(tp));
}

void write_all(int fd, const char* data, size_t size) {
  size_t done = 0;
  while (done < size) {
    const ssize_t n = ::write(fd, data + done, size - done);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw Error{ErrorCode::IoError, std::strerror(errno)};
    }
    done += static_cast<size_t>(n);
  }
}

class FileSink final : public IGossipSink {
 public:
  explicit FileSink(int fd) : fd_(fd) {}

  ~FileSink() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  void publish(const GossipEvent& event) override {
    auto line = gossip_event_json(event);
    line.push_back('\n');

    // One write per event keeps concurrent readers from seeing half a line.
    std::scoped_lock lock(mu_);
    write_all(fd_, line.data(), line.size());
  }

 private:
  int fd_{-1};
  std::mutex mu_;
};

class NullSink final : public IGossipSink {
 public:
  void publish(const GossipEvent& event) override {
    log_debug("gossip publishing disabled, dropping {} messages", event.data.size());
  }
};

}  // namespace

std::string gossip_event_json(const GossipEvent& event) {
  json data = json::array();
  for (const auto& m : event.data) {
    json item{{"id", m.id},
              {"peer_id", m.peer_id},
              {"peer_display_name", m.peer_display_name},
              {"message", m.message},
              {"timestamp", format_timestamp(m.timestamp)}};
    if (m.dataset) {
      item["dataset"] = *m.dataset;
    }
    data.push_back(std::move(item));
  }
  const json doc{{"type", event.type}, {"data", std::move(data)}};
  return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::unique_ptr<IGossipSink> make_file_sink(const FileSinkConfig& cfg) {
  if (cfg.path.empty()) {
    throw Error{ErrorCode::ConfigurationError, "sink path is not configured"};
  }
  std::error_code ec;
  if (cfg.path.has_parent_path()) {
    std::filesystem::create_directories(cfg.path.parent_path(), ec);
  }
  const int fd = ::open(cfg.path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw Error{ErrorCode::IoError,
                std::format("failed to open sink {}: {}", cfg.path.string(), std::strerror(errno))};
  }
  return std::make_unique<FileSink>(fd);
}

std::unique_ptr<IGossipSink> make_null_sink() { return std::make_unique<NullSink>(); }

std::vector<std::string> read_sink_documents(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw Error{ErrorCode::IoError, std::format("failed to open sink: {}", path.string())};
  }

  std::vector<std::string> docs;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty()) {
      docs.push_back(std::move(line));
    }
  }
  return docs;
}

}  // namespace swarmcast
