#include "appdirs/providers/standard_directories.hpp"
#include "appdirs/core/logger.hpp"
#include "appdirs/infra/paths.hpp"

namespace appdirs::providers {

namespace fs = std::filesystem;

StandardDirectoryProvider::StandardDirectoryProvider(
    std::shared_ptr<const infra::Environment> env)
    : env_(std::move(env)) {}

auto StandardDirectoryProvider::base_path(DirectoryKind kind) const
    -> std::optional<fs::path> {
    switch (kind) {
        case DirectoryKind::Cache:
            return home_relative("Library/Caches");
        case DirectoryKind::Config:
        case DirectoryKind::Data:
        case DirectoryKind::DataLocal:
            return home_relative("Library/Application Support");
        case DirectoryKind::Favorites:
            return home_relative("Library/Favorites");
        case DirectoryKind::Preferences:
            return home_relative("Library/Preferences");
        case DirectoryKind::Log:
            return home_relative("Library/Logs");
        case DirectoryKind::Application:
            return fs::path("/Applications");
        case DirectoryKind::ApplicationShared:
            return fs::path("/Library/Frameworks");
        case DirectoryKind::UserApplication:
        case DirectoryKind::UserAppContainer:
            return home_relative("Applications");
        case DirectoryKind::AppContainer:
            return home_relative("Library/Containers");
        case DirectoryKind::Template:
        case DirectoryKind::AppContainerExecutable:
        case DirectoryKind::UserAppContainerExecutable:
            return std::nullopt;
    }
    return std::nullopt;
}

auto StandardDirectoryProvider::home_relative(std::string_view subpath) const
    -> std::optional<fs::path> {
    auto home = env_->home_dir();
    if (!home) {
        LOG_DEBUG("No home directory, ~/{} unavailable", subpath);
        return std::nullopt;
    }
    return infra::join_segment(*home, subpath, Platform::MacOS);
}

} // namespace appdirs::providers
