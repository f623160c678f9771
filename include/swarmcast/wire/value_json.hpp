#pragma once

#include <string>

#include "swarmcast/wire/value.hpp"

namespace swarmcast::wire {

// Debug rendering. Mappings with only string keys become JSON objects, other
// mappings become arrays of [key, value] pairs; Payload and WorldState become
// objects tagged with a "kind" member.
std::string dump_json(const Value& value, int indent = -1);

// Compact single-line rendering used where a Value must become display text.
std::string display_text(const Value& value);

}  // namespace swarmcast::wire
