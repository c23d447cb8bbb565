#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "appdirs/core/error.hpp"
#include "appdirs/core/types.hpp"
#include "appdirs/infra/environment.hpp"

namespace appdirs {

using json = nlohmann::json;

/// Library configuration.
///
/// `overrides` maps a directory kind name ("cache", "config", "log", ...) to a
/// base directory that replaces the platform's. Values may reference
/// environment variables as `${VAR}`.
struct Config {
    std::string log_level = "info";
    std::map<std::string, std::string> overrides;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, overrides)

auto default_config() -> Config;

/// Parses and validates a JSON configuration document.
auto parse_config(std::string_view text) -> Result<Config>;

/// Loads a configuration file. A missing, unreadable or invalid file is
/// logged and yields the defaults.
auto load_config(const std::filesystem::path& path) -> Config;

/// Checks log level and override kind names.
auto validate_config(const Config& config) -> VoidResult;

/// Resolves `${VAR}` references against `env`.
/// Supports `$${VAR}` escape (literal `${VAR}`). Unset variables are kept as
/// written.
auto resolve_env_refs(std::string_view input, const infra::Environment& env) -> std::string;

} // namespace appdirs
