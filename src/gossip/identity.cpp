#include "swarmcast/gossip/identity.hpp"

#include <array>
#include <cstdint>
#include <format>

#include <xxhash.h>

namespace swarmcast {
namespace {

constexpr uint64_t kNameSeed = 0x70656572;

constexpr std::array<std::string_view, 32> kAdjectives{
    "agile",   "bold",     "bright",  "calm",    "clever",  "curious", "daring",  "eager",
    "fierce",  "gentle",   "giant",   "graceful", "hairy",  "humble",  "jolly",   "keen",
    "lively",  "loud",     "lucky",   "mighty",  "nimble",  "noisy",   "patient", "playful",
    "quick",   "quiet",    "rapid",   "shy",     "sleek",   "sly",     "swift",   "wild"};

constexpr std::array<std::string_view, 32> kAnimals{
    "alpaca",  "badger",  "beaver",   "bison",   "camel",   "cheetah", "crane",   "dolphin",
    "eagle",   "falcon",  "ferret",   "gecko",   "gorilla", "heron",   "ibis",    "jaguar",
    "koala",   "lemur",   "lynx",     "marmot",  "mole",    "ocelot",  "otter",   "owl",
    "panther", "puffin",  "raccoon",  "salmon",  "stork",   "tapir",   "turtle",  "weasel"};

class HashedNameResolver final : public IIdentityResolver {
 public:
  std::string display_name(std::string_view peer_id) const override {
    if (peer_id.empty()) {
      return std::string(peer_id);
    }
    const uint64_t h = XXH64(peer_id.data(), peer_id.size(), kNameSeed);
    const auto first = kAdjectives[h % kAdjectives.size()];
    const auto second = kAdjectives[(h >> 16) % kAdjectives.size()];
    const auto animal = kAnimals[(h >> 32) % kAnimals.size()];
    return std::format("{} {} {}", first, second, animal);
  }
};

}  // namespace

std::unique_ptr<IIdentityResolver> make_hashed_name_resolver() {
  return std::make_unique<HashedNameResolver>();
}

}  // namespace swarmcast
