#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace swarmcast {

// Maps a peer identifier to a human-readable name. Implementations must be
// pure and total: the same id always yields the same name, and no id throws.
class IIdentityResolver {
 public:
  virtual ~IIdentityResolver() = default;

  virtual std::string display_name(std::string_view peer_id) const = 0;
};

// "adjective adjective animal" picked from fixed word lists by xxh64 of the
// id. An empty id is returned unchanged.
std::unique_ptr<IIdentityResolver> make_hashed_name_resolver();

}  // namespace swarmcast
