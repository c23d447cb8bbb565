#include "appdirs/providers/override.hpp"
#include "appdirs/core/logger.hpp"
#include "appdirs/infra/paths.hpp"

namespace appdirs::providers {

namespace fs = std::filesystem;

OverrideProvider::OverrideProvider(std::map<DirectoryKind, fs::path> overrides,
                                   std::shared_ptr<const BaseDirectoryProvider> fallback)
    : overrides_(std::move(overrides)), fallback_(std::move(fallback)) {}

auto OverrideProvider::base_path(DirectoryKind kind) const -> std::optional<fs::path> {
    if (auto it = overrides_.find(kind); it != overrides_.end()) {
        return it->second;
    }
    if (!fallback_) return std::nullopt;
    return fallback_->base_path(kind);
}

auto make_override_provider(const Config& config, Platform platform,
                            const infra::Environment& env,
                            std::shared_ptr<const BaseDirectoryProvider> fallback)
    -> std::shared_ptr<const OverrideProvider> {
    std::map<DirectoryKind, fs::path> overrides;

    for (const auto& [name, value] : config.overrides) {
        auto kind = directory_kind_from_string(name);
        if (!kind) {
            LOG_WARN("Ignoring override for unknown directory kind '{}'", name);
            continue;
        }

        auto path = infra::path_from_utf8(resolve_env_refs(value, env));
        if (!infra::is_absolute_for(path, platform)) {
            LOG_WARN("Ignoring {} override '{}': not an absolute {} path",
                     name, path.string(), to_string(platform));
            continue;
        }

        LOG_DEBUG("Override {} -> {}", name, path.string());
        overrides.emplace(*kind, std::move(path));
    }

    return std::make_shared<OverrideProvider>(std::move(overrides), std::move(fallback));
}

} // namespace appdirs::providers
