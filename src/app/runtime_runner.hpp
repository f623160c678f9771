#pragma once

#include <functional>
#include <optional>
#include <string>

#include "app/config_types.hpp"
#include "swarmcast/core/expected.hpp"

int run_cli_impl(int argc, char** argv);

namespace swarmcast::app {

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

// Process environment through std::getenv; empty values count as unset.
std::optional<std::string> process_env(const char* name);

// Flags first, then SWARMCAST_* environment variables, then defaults.
swarmcast::Expected<Config> parse_args(int argc, char** argv, const EnvLookup& env);

swarmcast::Expected<void> validate_config(const Config& cfg);

int exit_code_for(const swarmcast::Error& e) noexcept;

}  // namespace swarmcast::app
