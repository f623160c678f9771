#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace swarmcast::wire {

// Wire tags; every encoded node starts with one as an 8-byte big-endian word.
enum class TypeTag : uint64_t {
  List = 1,
  Mapping = 2,
  String = 3,
  Integer = 4,
  Float = 5,
  Boolean = 6,
  Payload = 7,
  WorldState = 8,
  None = 9,
};

const char* type_tag_name(TypeTag tag) noexcept;
bool is_known_tag(uint64_t raw) noexcept;

struct Payload;
struct WorldState;

class Value {
 public:
  using List = std::vector<Value>;
  using Mapping = std::vector<std::pair<Value, Value>>;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : storage_(b) {}
  template <class T>
    requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
  Value(T i) : storage_(static_cast<int64_t>(i)) {}
  Value(double d) : storage_(d) {}
  Value(std::string s) : storage_(std::move(s)) {}
  Value(std::string_view s) : storage_(std::string(s)) {}
  Value(const char* s) : storage_(std::string(s)) {}
  Value(List items) : storage_(std::move(items)) {}
  Value(Mapping entries) : storage_(std::move(entries)) {}
  Value(Payload payload);
  Value(WorldState state);

  static Value list(std::initializer_list<Value> items);
  static Value mapping(std::initializer_list<std::pair<Value, Value>> entries);

  TypeTag tag() const noexcept;

  bool is_none() const noexcept { return std::holds_alternative<std::monostate>(storage_); }
  bool is_bool() const noexcept { return std::holds_alternative<bool>(storage_); }
  bool is_integer() const noexcept { return std::holds_alternative<int64_t>(storage_); }
  bool is_float() const noexcept { return std::holds_alternative<double>(storage_); }
  bool is_string() const noexcept { return std::holds_alternative<std::string>(storage_); }
  bool is_list() const noexcept { return std::holds_alternative<List>(storage_); }
  bool is_mapping() const noexcept { return std::holds_alternative<Mapping>(storage_); }
  bool is_payload() const noexcept {
    return std::holds_alternative<std::shared_ptr<const Payload>>(storage_);
  }
  bool is_world_state() const noexcept {
    return std::holds_alternative<std::shared_ptr<const WorldState>>(storage_);
  }

  // Throw Error{InvalidArgument} when the value holds another variant.
  bool as_bool() const;
  int64_t as_integer() const;
  double as_float() const;
  const std::string& as_string() const;
  const List& as_list() const;
  const Mapping& as_mapping() const;
  const Payload& as_payload() const;
  const WorldState& as_world_state() const;

  // Mapping lookup by string key; nullptr when absent or not a mapping.
  const Value* find(std::string_view key) const noexcept;

  friend bool operator==(const Value& a, const Value& b);

 private:
  std::variant<std::monostate,
               bool,
               int64_t,
               double,
               std::string,
               List,
               Mapping,
               std::shared_ptr<const Payload>,
               std::shared_ptr<const WorldState>>
      storage_{};
};

struct Payload {
  Value world_state{};
  Value actions{};
  Value metadata{};

  friend bool operator==(const Payload&, const Payload&) = default;
};

struct WorldState {
  Value environment_states{};
  Value opponent_states{};
  Value personal_states{};

  friend bool operator==(const WorldState&, const WorldState&) = default;
};

}  // namespace swarmcast::wire
