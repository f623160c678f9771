#include "swarmcast/wire/value_json.hpp"

#include <nlohmann/json.hpp>

namespace swarmcast::wire {
namespace {

using json = nlohmann::json;

json to_json(const Value& value) {
  switch (value.tag()) {
    case TypeTag::None:
      return nullptr;
    case TypeTag::Boolean:
      return value.as_bool();
    case TypeTag::Integer:
      return value.as_integer();
    case TypeTag::Float:
      return value.as_float();
    case TypeTag::String:
      return value.as_string();
    case TypeTag::List: {
      json arr = json::array();
      for (const auto& item : value.as_list()) {
        arr.push_back(to_json(item));
      }
      return arr;
    }
    case TypeTag::Mapping: {
      const auto& entries = value.as_mapping();
      bool string_keys = true;
      for (const auto& entry : entries) {
        string_keys = string_keys && entry.first.is_string();
      }
      if (string_keys) {
        json obj = json::object();
        for (const auto& [k, v] : entries) {
          obj[k.as_string()] = to_json(v);
        }
        return obj;
      }
      json arr = json::array();
      for (const auto& [k, v] : entries) {
        arr.push_back(json::array({to_json(k), to_json(v)}));
      }
      return arr;
    }
    case TypeTag::Payload: {
      const auto& p = value.as_payload();
      return json{{"kind", "payload"},
                  {"world_state", to_json(p.world_state)},
                  {"actions", to_json(p.actions)},
                  {"metadata", to_json(p.metadata)}};
    }
    case TypeTag::WorldState: {
      const auto& w = value.as_world_state();
      return json{{"kind", "world_state"},
                  {"environment_states", to_json(w.environment_states)},
                  {"opponent_states", to_json(w.opponent_states)},
                  {"personal_states", to_json(w.personal_states)}};
    }
  }
  return nullptr;
}

}  // namespace

std::string dump_json(const Value& value, int indent) {
  return to_json(value).dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string display_text(const Value& value) {
  if (value.is_string()) {
    return value.as_string();
  }
  return dump_json(value);
}

}  // namespace swarmcast::wire
