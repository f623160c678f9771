#include "swarmcast/wire/codec.hpp"

#include <bit>
#include <cstdint>
#include <cstring>
#include <format>
#include <string>
#include <string_view>

#include "swarmcast/core/error.hpp"

namespace swarmcast::wire {
namespace {

constexpr std::byte kTrueByte{'1'};
constexpr std::byte kFalseByte{'0'};
constexpr size_t kFloatWidth = 8;

bool is_valid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    const auto c = static_cast<uint8_t>(s[i]);
    size_t extra = 0;
    uint32_t cp = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      cp = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= s.size()) {
      return false;
    }
    for (size_t k = 1; k <= extra; ++k) {
      const auto cc = static_cast<uint8_t>(s[i + k]);
      if ((cc & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range code points.
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000) || (cp >= 0xD800 && cp <= 0xDFFF) ||
        cp > 0x10FFFF) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

void put_u64(Bytes& out, uint64_t v) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<std::byte>((v >> shift) & 0xFF));
  }
}

void put_tag(Bytes& out, TypeTag tag) { put_u64(out, static_cast<uint64_t>(tag)); }

size_t integer_width(int64_t v) {
  size_t width = 1;
  while (width < 8) {
    const int64_t hi = (int64_t{1} << (8 * width - 1)) - 1;
    const int64_t lo = -hi - 1;
    if (v >= lo && v <= hi) {
      break;
    }
    ++width;
  }
  return width;
}

void encode_node(const Value& value, Bytes& out) {
  const TypeTag tag = value.tag();
  put_tag(out, tag);
  switch (tag) {
    case TypeTag::None:
      return;
    case TypeTag::Boolean:
      out.push_back(value.as_bool() ? kTrueByte : kFalseByte);
      return;
    case TypeTag::Integer: {
      const int64_t v = value.as_integer();
      const size_t width = integer_width(v);
      put_u64(out, width);
      const auto bits = static_cast<uint64_t>(v);
      for (size_t k = width; k > 0; --k) {
        out.push_back(static_cast<std::byte>((bits >> (8 * (k - 1))) & 0xFF));
      }
      return;
    }
    case TypeTag::Float:
      put_u64(out, kFloatWidth);
      put_u64(out, std::bit_cast<uint64_t>(value.as_float()));
      return;
    case TypeTag::String: {
      const auto& s = value.as_string();
      if (!is_valid_utf8(s)) {
        throw Error{ErrorCode::UnsupportedType, "string value is not valid UTF-8"};
      }
      put_u64(out, s.size());
      const auto* p = reinterpret_cast<const std::byte*>(s.data());
      out.insert(out.end(), p, p + s.size());
      return;
    }
    case TypeTag::List: {
      const auto& items = value.as_list();
      put_u64(out, items.size());
      for (const auto& item : items) {
        encode_node(item, out);
      }
      return;
    }
    case TypeTag::Mapping: {
      const auto& entries = value.as_mapping();
      put_u64(out, entries.size());
      for (const auto& [k, v] : entries) {
        encode_node(k, out);
        encode_node(v, out);
      }
      return;
    }
    case TypeTag::Payload: {
      const auto& p = value.as_payload();
      encode_node(p.world_state, out);
      encode_node(p.actions, out);
      encode_node(p.metadata, out);
      return;
    }
    case TypeTag::WorldState: {
      const auto& w = value.as_world_state();
      encode_node(w.environment_states, out);
      encode_node(w.opponent_states, out);
      encode_node(w.personal_states, out);
      return;
    }
  }
  throw Error{ErrorCode::UnsupportedType, "value kind has no wire encoding"};
}

class Reader {
 public:
  explicit Reader(std::span<const std::byte> in) : in_(in) {}

  size_t offset() const noexcept { return pos_; }

  uint64_t u64(const char* what) {
    require(8, what);
    uint64_t v = 0;
    for (size_t k = 0; k < 8; ++k) {
      v = (v << 8) | std::to_integer<uint64_t>(in_[pos_ + k]);
    }
    pos_ += 8;
    return v;
  }

  std::span<const std::byte> take(uint64_t n, const char* what) {
    require(n, what);
    auto out = in_.subspan(pos_, static_cast<size_t>(n));
    pos_ += static_cast<size_t>(n);
    return out;
  }

  size_t remaining() const noexcept { return in_.size() - pos_; }

 private:
  void require(uint64_t n, const char* what) const {
    if (n > remaining()) {
      throw Error{ErrorCode::TruncatedInput,
                  std::format("{} needs {} bytes at offset {}, {} remain", what, n,
                              pos_, remaining())};
    }
  }

  std::span<const std::byte> in_;
  size_t pos_{0};
};

int64_t decode_integer(std::span<const std::byte> b) {
  if (b.empty()) {
    return 0;
  }
  const bool negative = (std::to_integer<uint8_t>(b[0]) & 0x80) != 0;
  if (b.size() > 8) {
    const size_t surplus = b.size() - 8;
    const std::byte fill = negative ? std::byte{0xFF} : std::byte{0x00};
    for (size_t k = 0; k < surplus; ++k) {
      if (b[k] != fill) {
        throw Error{ErrorCode::IntegerOverflow,
                    std::format("{}-byte integer does not fit in 64 bits", b.size())};
      }
    }
    const bool low_negative = (std::to_integer<uint8_t>(b[surplus]) & 0x80) != 0;
    if (low_negative != negative) {
      throw Error{ErrorCode::IntegerOverflow,
                  std::format("{}-byte integer does not fit in 64 bits", b.size())};
    }
    b = b.subspan(surplus);
  }
  uint64_t bits = negative ? ~uint64_t{0} : 0;
  for (const auto byte : b) {
    bits = (bits << 8) | std::to_integer<uint64_t>(byte);
  }
  return static_cast<int64_t>(bits);
}

Value decode_node(Reader& r, size_t depth) {
  if (depth > kMaxDecodeDepth) {
    throw Error{ErrorCode::CodecError,
                std::format("nesting exceeds {} levels", kMaxDecodeDepth)};
  }
  const size_t tag_offset = r.offset();
  const uint64_t raw_tag = r.u64("type tag");
  if (!is_known_tag(raw_tag)) {
    throw Error{ErrorCode::UnknownTypeTag,
                std::format("unknown type tag {} at offset {}", raw_tag, tag_offset)};
  }

  switch (static_cast<TypeTag>(raw_tag)) {
    case TypeTag::None:
      return Value{};
    case TypeTag::Boolean: {
      const auto b = r.take(1, "boolean")[0];
      if (b == kTrueByte) {
        return Value{true};
      }
      if (b == kFalseByte) {
        return Value{false};
      }
      throw Error{ErrorCode::CodecError,
                  std::format("invalid boolean byte 0x{:02x} at offset {}",
                              std::to_integer<unsigned>(b), tag_offset + kTagSize)};
    }
    case TypeTag::Integer: {
      const uint64_t width = r.u64("integer length");
      return Value{decode_integer(r.take(width, "integer body"))};
    }
    case TypeTag::Float: {
      const uint64_t width = r.u64("float length");
      const auto body = r.take(width, "float body");
      if (width != kFloatWidth) {
        throw Error{ErrorCode::CodecError,
                    std::format("float body is {} bytes, expected 8", width)};
      }
      uint64_t bits = 0;
      for (const auto byte : body) {
        bits = (bits << 8) | std::to_integer<uint64_t>(byte);
      }
      return Value{std::bit_cast<double>(bits)};
    }
    case TypeTag::String: {
      const uint64_t n = r.u64("string length");
      const auto body = r.take(n, "string body");
      std::string s(reinterpret_cast<const char*>(body.data()), body.size());
      if (!is_valid_utf8(s)) {
        throw Error{ErrorCode::CodecError,
                    std::format("string at offset {} is not valid UTF-8", tag_offset)};
      }
      return Value{std::move(s)};
    }
    case TypeTag::List: {
      const uint64_t n = r.u64("list count");
      // Every element needs at least a tag, so a larger count is already short.
      if (n > r.remaining() / kTagSize) {
        throw Error{ErrorCode::TruncatedInput,
                    std::format("list claims {} items, {} bytes remain", n, r.remaining())};
      }
      Value::List items;
      items.reserve(static_cast<size_t>(n));
      for (uint64_t k = 0; k < n; ++k) {
        items.push_back(decode_node(r, depth + 1));
      }
      return Value{std::move(items)};
    }
    case TypeTag::Mapping: {
      const uint64_t n = r.u64("mapping count");
      if (n > r.remaining() / (2 * kTagSize)) {
        throw Error{ErrorCode::TruncatedInput,
                    std::format("mapping claims {} entries, {} bytes remain", n,
                                r.remaining())};
      }
      Value::Mapping entries;
      entries.reserve(static_cast<size_t>(n));
      for (uint64_t k = 0; k < n; ++k) {
        Value key = decode_node(r, depth + 1);
        Value val = decode_node(r, depth + 1);
        entries.emplace_back(std::move(key), std::move(val));
      }
      return Value{std::move(entries)};
    }
    case TypeTag::Payload: {
      Payload p{};
      p.world_state = decode_node(r, depth + 1);
      p.actions = decode_node(r, depth + 1);
      p.metadata = decode_node(r, depth + 1);
      return Value{std::move(p)};
    }
    case TypeTag::WorldState: {
      WorldState w{};
      w.environment_states = decode_node(r, depth + 1);
      w.opponent_states = decode_node(r, depth + 1);
      w.personal_states = decode_node(r, depth + 1);
      return Value{std::move(w)};
    }
  }
  throw Error{ErrorCode::UnknownTypeTag, std::format("unknown type tag {}", raw_tag)};
}

}  // namespace

Bytes encode(const Value& value) {
  Bytes out;
  encode_into(value, out);
  return out;
}

void encode_into(const Value& value, Bytes& out) { encode_node(value, out); }

DecodeResult decode_prefix(std::span<const std::byte> bytes) {
  Reader r(bytes);
  DecodeResult out{};
  out.value = decode_node(r, 0);
  out.consumed = r.offset();
  return out;
}

Value decode(std::span<const std::byte> bytes) { return decode_prefix(bytes).value; }

}  // namespace swarmcast::wire
