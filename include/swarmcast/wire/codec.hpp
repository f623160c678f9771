#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "swarmcast/wire/value.hpp"

namespace swarmcast::wire {

using Bytes = std::vector<std::byte>;

inline constexpr size_t kTagSize = 8;
inline constexpr size_t kLengthSize = 8;
inline constexpr size_t kMaxDecodeDepth = 256;

// Throws Error{UnsupportedType} for strings that are not valid UTF-8.
Bytes encode(const Value& value);
void encode_into(const Value& value, Bytes& out);

struct DecodeResult {
  Value value{};
  size_t consumed{};
};

// Decodes the first complete node. Throws Error with TruncatedInput,
// UnknownTypeTag, IntegerOverflow or CodecError; the input is never modified.
DecodeResult decode_prefix(std::span<const std::byte> bytes);

// Same as decode_prefix; trailing bytes after the first node are ignored.
Value decode(std::span<const std::byte> bytes);

}  // namespace swarmcast::wire
