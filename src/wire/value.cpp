#include "swarmcast/wire/value.hpp"

#include <format>

#include "swarmcast/core/error.hpp"

namespace swarmcast::wire {
namespace {

[[noreturn]] void throw_kind_mismatch(const char* wanted, TypeTag actual) {
  throw Error{ErrorCode::InvalidArgument,
              std::format("value is {}, not {}", type_tag_name(actual), wanted)};
}

bool mapping_equal(const Value::Mapping& a, const Value::Mapping& b) {
  if (a.size() != b.size()) {
    return false;
  }
  std::vector<bool> used(b.size(), false);
  for (const auto& [ka, va] : a) {
    bool matched = false;
    for (size_t j = 0; j < b.size(); ++j) {
      if (!used[j] && b[j].first == ka && b[j].second == va) {
        used[j] = true;
        matched = true;
        break;
      }
    }
    if (!matched) {
      return false;
    }
  }
  return true;
}

}  // namespace

const char* type_tag_name(TypeTag tag) noexcept {
  switch (tag) {
    case TypeTag::List:
      return "list";
    case TypeTag::Mapping:
      return "mapping";
    case TypeTag::String:
      return "string";
    case TypeTag::Integer:
      return "integer";
    case TypeTag::Float:
      return "float";
    case TypeTag::Boolean:
      return "boolean";
    case TypeTag::Payload:
      return "payload";
    case TypeTag::WorldState:
      return "world_state";
    case TypeTag::None:
      return "none";
  }
  return "unknown";
}

bool is_known_tag(uint64_t raw) noexcept {
  return raw >= static_cast<uint64_t>(TypeTag::List) &&
         raw <= static_cast<uint64_t>(TypeTag::None);
}

Value::Value(Payload payload)
    : storage_(std::make_shared<const Payload>(std::move(payload))) {}

Value::Value(WorldState state)
    : storage_(std::make_shared<const WorldState>(std::move(state))) {}

Value Value::list(std::initializer_list<Value> items) {
  return Value(List(items));
}

Value Value::mapping(std::initializer_list<std::pair<Value, Value>> entries) {
  return Value(Mapping(entries));
}

TypeTag Value::tag() const noexcept {
  switch (storage_.index()) {
    case 0:
      return TypeTag::None;
    case 1:
      return TypeTag::Boolean;
    case 2:
      return TypeTag::Integer;
    case 3:
      return TypeTag::Float;
    case 4:
      return TypeTag::String;
    case 5:
      return TypeTag::List;
    case 6:
      return TypeTag::Mapping;
    case 7:
      return TypeTag::Payload;
    case 8:
      return TypeTag::WorldState;
  }
  return TypeTag::None;
}

bool Value::as_bool() const {
  if (const auto* b = std::get_if<bool>(&storage_)) {
    return *b;
  }
  throw_kind_mismatch("boolean", tag());
}

int64_t Value::as_integer() const {
  if (const auto* i = std::get_if<int64_t>(&storage_)) {
    return *i;
  }
  throw_kind_mismatch("integer", tag());
}

double Value::as_float() const {
  if (const auto* d = std::get_if<double>(&storage_)) {
    return *d;
  }
  throw_kind_mismatch("float", tag());
}

const std::string& Value::as_string() const {
  if (const auto* s = std::get_if<std::string>(&storage_)) {
    return *s;
  }
  throw_kind_mismatch("string", tag());
}

const Value::List& Value::as_list() const {
  if (const auto* l = std::get_if<List>(&storage_)) {
    return *l;
  }
  throw_kind_mismatch("list", tag());
}

const Value::Mapping& Value::as_mapping() const {
  if (const auto* m = std::get_if<Mapping>(&storage_)) {
    return *m;
  }
  throw_kind_mismatch("mapping", tag());
}

const Payload& Value::as_payload() const {
  if (const auto* p = std::get_if<std::shared_ptr<const Payload>>(&storage_)) {
    return **p;
  }
  throw_kind_mismatch("payload", tag());
}

const WorldState& Value::as_world_state() const {
  if (const auto* w = std::get_if<std::shared_ptr<const WorldState>>(&storage_)) {
    return **w;
  }
  throw_kind_mismatch("world_state", tag());
}

const Value* Value::find(std::string_view key) const noexcept {
  const auto* entries = std::get_if<Mapping>(&storage_);
  if (entries == nullptr) {
    return nullptr;
  }
  // Later duplicates win, as they would in a decoded dictionary.
  const Value* found = nullptr;
  for (const auto& [k, v] : *entries) {
    if (const auto* s = std::get_if<std::string>(&k.storage_); s != nullptr && *s == key) {
      found = &v;
    }
  }
  return found;
}

bool operator==(const Value& a, const Value& b) {
  if (a.storage_.index() != b.storage_.index()) {
    return false;
  }
  switch (a.tag()) {
    case TypeTag::None:
      return true;
    case TypeTag::Boolean:
      return std::get<bool>(a.storage_) == std::get<bool>(b.storage_);
    case TypeTag::Integer:
      return std::get<int64_t>(a.storage_) == std::get<int64_t>(b.storage_);
    case TypeTag::Float:
      return std::get<double>(a.storage_) == std::get<double>(b.storage_);
    case TypeTag::String:
      return std::get<std::string>(a.storage_) == std::get<std::string>(b.storage_);
    case TypeTag::List:
      return std::get<Value::List>(a.storage_) == std::get<Value::List>(b.storage_);
    case TypeTag::Mapping:
      return mapping_equal(std::get<Value::Mapping>(a.storage_),
                           std::get<Value::Mapping>(b.storage_));
    case TypeTag::Payload:
      return a.as_payload() == b.as_payload();
    case TypeTag::WorldState:
      return a.as_world_state() == b.as_world_state();
  }
  return false;
}

}  // namespace swarmcast::wire
