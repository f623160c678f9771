#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace swarmcast {

// Peer identifier -> raw bytes that peer wrote under one key.
using RoundRecord = std::map<std::string, std::vector<std::byte>>;

// Read side of the shared peer-to-peer key-value store. Keys are round
// numbers in decimal. Throws Error{TransportError} when the store cannot be
// reached; an absent key is std::nullopt.
class IPeerStore {
 public:
  virtual ~IPeerStore() = default;

  virtual std::optional<RoundRecord> get(const std::string& key) = 0;
};

// Local mirror laid out as <root>/<key>/<peer_id>.bin.
std::unique_ptr<IPeerStore> make_directory_store(const std::filesystem::path& root);

std::string round_key(int64_t round);

}  // namespace swarmcast
