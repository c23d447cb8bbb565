#include "appdirs/core/config.hpp"
#include "appdirs/core/logger.hpp"

#include <array>
#include <fstream>
#include <sstream>

namespace appdirs {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off",
};

} // anonymous namespace

auto default_config() -> Config {
    return Config{};
}

auto validate_config(const Config& config) -> VoidResult {
    bool known_level = false;
    for (auto level : kLogLevels) {
        if (level == config.log_level) known_level = true;
    }
    if (!known_level) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                          "unknown log level", config.log_level));
    }

    for (const auto& [name, path] : config.overrides) {
        if (!directory_kind_from_string(name)) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              "unknown directory kind in overrides", name));
        }
        if (path.empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                                              "empty override path", name));
        }
    }
    return {};
}

auto parse_config(std::string_view text) -> Result<Config> {
    Config config;
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            return std::unexpected(make_error(ErrorCode::SerializationError,
                                              "config root must be an object"));
        }
        config = j.get<Config>();
    } catch (const json::exception& e) {
        return std::unexpected(make_error(ErrorCode::SerializationError,
                                          "failed to parse config", e.what()));
    }

    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto config = parse_config(buffer.str());
    if (!config) {
        LOG_ERROR("Invalid config {}: [{}] {}", path.string(),
                  error_code_to_string(config.error().code()), config.error().what());
        return default_config();
    }
    LOG_DEBUG("Loaded config from {} ({} overrides)", path.string(), config->overrides.size());
    return std::move(*config);
}

auto resolve_env_refs(std::string_view input, const infra::Environment& env) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // $${VAR} -> literal ${VAR}
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            result += '$';
            i += 2;
            continue;
        }

        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);

                if (auto val = env.get(var_name)) {
                    result += *val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace appdirs
