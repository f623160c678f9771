#include <cstdint>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

#include "swarmcast/core/error.hpp"
#include "swarmcast/core/log.hpp"
#include "swarmcast/store/peer_store.hpp"

namespace swarmcast {
namespace {

constexpr std::string_view kEntryExtension = ".bin";

std::vector<std::byte> read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw Error{ErrorCode::IoError, std::format("failed to open entry: {}", path.string())};
  }
  std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw Error{ErrorCode::IoError, std::format("failed to read entry: {}", path.string())};
  }
  std::vector<std::byte> out(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    out[i] = static_cast<std::byte>(raw[i]);
  }
  return out;
}

class DirectoryStore final : public IPeerStore {
 public:
  explicit DirectoryStore(std::filesystem::path root) : root_(std::move(root)) {}

  std::optional<RoundRecord> get(const std::string& key) override {
    if (key.empty() || key.find('/') != std::string::npos || key == "." || key == "..") {
      throw Error{ErrorCode::InvalidArgument, std::format("invalid store key: {}", key)};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
      throw Error{ErrorCode::TransportError,
                  std::format("store root is not reachable: {}", root_.string())};
    }
    const auto dir = root_ / key;
    if (!std::filesystem::is_directory(dir, ec)) {
      return std::nullopt;
    }

    RoundRecord record;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
      if (!entry.is_regular_file() || entry.path().extension() != kEntryExtension) {
        continue;
      }
      const auto peer_id = entry.path().stem().string();
      try {
        record.emplace(peer_id, read_file(entry.path()));
      } catch (const Error& e) {
        // A peer entry still being written is skipped for this poll.
        log_warn("skipping unreadable store entry key={} peer={}: {}", key, peer_id, e.what());
      }
    }
    if (ec) {
      throw Error{ErrorCode::TransportError,
                  std::format("failed to list {}: {}", dir.string(), ec.message())};
    }
    return record;
  }

 private:
  std::filesystem::path root_;
};

}  // namespace

std::unique_ptr<IPeerStore> make_directory_store(const std::filesystem::path& root) {
  if (root.empty()) {
    throw Error{ErrorCode::ConfigurationError, "store directory is not configured"};
  }
  return std::make_unique<DirectoryStore>(root);
}

std::string round_key(int64_t round) { return std::to_string(round); }

}  // namespace swarmcast
