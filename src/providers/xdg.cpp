#include "appdirs/providers/xdg.hpp"
#include "appdirs/core/logger.hpp"
#include "appdirs/infra/paths.hpp"

namespace appdirs::providers {

namespace fs = std::filesystem;

XdgProvider::XdgProvider(std::shared_ptr<const infra::Environment> env)
    : env_(std::move(env)) {}

auto XdgProvider::base_path(DirectoryKind kind) const -> std::optional<fs::path> {
    switch (kind) {
        case DirectoryKind::Cache:
            return xdg_home("XDG_CACHE_HOME", ".cache");
        case DirectoryKind::Config:
            return xdg_home("XDG_CONFIG_HOME", ".config");
        case DirectoryKind::Data:
        case DirectoryKind::DataLocal:
            return xdg_home("XDG_DATA_HOME", ".local/share");
        case DirectoryKind::Application:
            return fs::path("/opt");
        case DirectoryKind::ApplicationShared:
            return fs::path("/usr/lib");
        case DirectoryKind::UserApplication: {
            auto home = env_->home_dir();
            if (!home) return std::nullopt;
            return infra::join_segment(*home, ".local/bin", Platform::Linux);
        }
        case DirectoryKind::Favorites:
        case DirectoryKind::Preferences:
        case DirectoryKind::Template:
        case DirectoryKind::Log:
        case DirectoryKind::AppContainer:
        case DirectoryKind::AppContainerExecutable:
        case DirectoryKind::UserAppContainer:
        case DirectoryKind::UserAppContainerExecutable:
            return std::nullopt;
    }
    return std::nullopt;
}

auto XdgProvider::xdg_home(std::string_view var, std::string_view fallback) const
    -> std::optional<fs::path> {
    if (auto value = env_->get(var); value && !value->empty()) {
        fs::path path(*value);
        if (infra::is_absolute_for(path, Platform::Linux)) {
            return path;
        }
        LOG_DEBUG("Ignoring relative {}={}", var, *value);
    }

    auto home = env_->home_dir();
    if (!home) {
        LOG_DEBUG("No home directory, {} unavailable", var);
        return std::nullopt;
    }
    return infra::join_segment(*home, fallback, Platform::Linux);
}

} // namespace appdirs::providers
