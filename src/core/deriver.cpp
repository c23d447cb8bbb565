#include "appdirs/core/deriver.hpp"
#include "appdirs/core/logger.hpp"
#include "appdirs/infra/paths.hpp"

#include <string>

namespace appdirs {

namespace {

constexpr std::string_view kLinuxLogs = "logs";
constexpr std::string_view kMacTemplates = "Templates";
constexpr std::string_view kContainerData = "Data";
constexpr std::string_view kBundleSuffix = ".app";
constexpr std::string_view kBundleContents = "Contents";
constexpr std::string_view kBundleExecutables = "MacOS";

} // anonymous namespace

AppPathDeriver::AppPathDeriver(Platform platform,
                               std::shared_ptr<const providers::BaseDirectoryProvider> provider)
    : platform_(platform), provider_(std::move(provider)) {}

auto AppPathDeriver::generic_dir(DirectoryKind kind) const -> PathResult {
    if (!has_generic_form(kind)) return std::nullopt;
    return provider_->base_path(kind);
}

auto AppPathDeriver::install_dir(DirectoryKind kind) const -> PathResult {
    if (!is_install_location(kind)) return std::nullopt;
    return provider_->base_path(kind);
}

auto AppPathDeriver::dir_for(DirectoryKind kind, std::string_view app) const -> PathResult {
    PathResult result;
    switch (platform_) {
        case Platform::Linux: result = derive_xdg(kind, app); break;
        case Platform::Windows: result = derive_windows(kind, app); break;
        case Platform::MacOS: result = derive_macos(kind, app); break;
    }
    if (Logger::get()->should_log(spdlog::level::trace)) {
        LOG_TRACE("{} {}_for({}) -> {}", to_string(platform_), to_string(kind), app,
                  result ? result->string() : std::string("none"));
    }
    return result;
}

// Linux and the BSDs: one segment under the XDG home. Logs live inside the
// application's local data directory. Favorites, preferences and templates
// have no per-application location.
auto AppPathDeriver::derive_xdg(DirectoryKind kind, std::string_view app) const -> PathResult {
    switch (kind) {
        case DirectoryKind::Cache:
        case DirectoryKind::Config:
        case DirectoryKind::Data:
        case DirectoryKind::DataLocal:
            return under(kind, {app});
        case DirectoryKind::Log:
            return under(DirectoryKind::DataLocal, {app, kLinuxLogs});
        case DirectoryKind::Favorites:
        case DirectoryKind::Preferences:
        case DirectoryKind::Template:
        case DirectoryKind::Application:
        case DirectoryKind::ApplicationShared:
        case DirectoryKind::UserApplication:
        case DirectoryKind::AppContainer:
        case DirectoryKind::AppContainerExecutable:
        case DirectoryKind::UserAppContainer:
        case DirectoryKind::UserAppContainerExecutable:
            return std::nullopt;
    }
    return std::nullopt;
}

// Windows: one segment under whatever Known Folder backs the kind. Vendor
// nesting is left to the caller.
auto AppPathDeriver::derive_windows(DirectoryKind kind, std::string_view app) const
    -> PathResult {
    switch (kind) {
        case DirectoryKind::Cache:
        case DirectoryKind::Config:
        case DirectoryKind::Data:
        case DirectoryKind::DataLocal:
        case DirectoryKind::Favorites:
        case DirectoryKind::Preferences:
        case DirectoryKind::Template:
        case DirectoryKind::Log:
            return under(kind, {app});
        case DirectoryKind::Application:
        case DirectoryKind::ApplicationShared:
        case DirectoryKind::UserApplication:
        case DirectoryKind::AppContainer:
        case DirectoryKind::AppContainerExecutable:
        case DirectoryKind::UserAppContainer:
        case DirectoryKind::UserAppContainerExecutable:
            return std::nullopt;
    }
    return std::nullopt;
}

// macOS: one segment under ~/Library for the ordinary kinds, plus the
// sandbox container (~/Library/Containers/<app>/Data) and the user's
// application bundle (~/Applications/<app>.app) layouts.
auto AppPathDeriver::derive_macos(DirectoryKind kind, std::string_view app) const
    -> PathResult {
    switch (kind) {
        case DirectoryKind::Cache:
        case DirectoryKind::Config:
        case DirectoryKind::Data:
        case DirectoryKind::DataLocal:
        case DirectoryKind::Favorites:
        case DirectoryKind::Preferences:
        case DirectoryKind::Log:
            return under(kind, {app});
        case DirectoryKind::Template:
            return under(DirectoryKind::Data, {app, kMacTemplates});
        case DirectoryKind::AppContainer:
            return under(DirectoryKind::AppContainer, {app, kContainerData});
        case DirectoryKind::AppContainerExecutable:
            return join(derive_macos(DirectoryKind::AppContainer, app),
                        {kBundleContents, kBundleExecutables});
        case DirectoryKind::UserAppContainer: {
            std::string bundle(app);
            bundle += kBundleSuffix;
            return under(DirectoryKind::UserAppContainer, {bundle});
        }
        case DirectoryKind::UserAppContainerExecutable:
            return join(derive_macos(DirectoryKind::UserAppContainer, app),
                        {kBundleContents, kBundleExecutables});
        case DirectoryKind::Application:
        case DirectoryKind::ApplicationShared:
        case DirectoryKind::UserApplication:
            return std::nullopt;
    }
    return std::nullopt;
}

auto AppPathDeriver::under(DirectoryKind kind,
                           std::initializer_list<std::string_view> segments) const -> PathResult {
    return join(provider_->base_path(kind), segments);
}

auto AppPathDeriver::join(PathResult base,
                          std::initializer_list<std::string_view> segments) const -> PathResult {
    if (!base) return std::nullopt;
    for (auto segment : segments) {
        base = infra::join_segment(*base, segment, platform_);
    }
    return base;
}

auto AppPathDeriver::cache_dir() const -> PathResult {
    return generic_dir(DirectoryKind::Cache);
}

auto AppPathDeriver::config_dir() const -> PathResult {
    return generic_dir(DirectoryKind::Config);
}

auto AppPathDeriver::data_dir() const -> PathResult {
    return generic_dir(DirectoryKind::Data);
}

auto AppPathDeriver::data_local_dir() const -> PathResult {
    return generic_dir(DirectoryKind::DataLocal);
}

auto AppPathDeriver::cache_dir_for(std::string_view app) const -> PathResult {
    return dir_for(DirectoryKind::Cache, app);
}

auto AppPathDeriver::config_dir_for(std::string_view app) const -> PathResult {
    return dir_for(DirectoryKind::Config, app);
}

auto AppPathDeriver::data_dir_for(std::string_view app) const -> PathResult {
    return dir_for(DirectoryKind::Data, app);
}

auto AppPathDeriver::data_local_dir_for(std::string_view app) const -> PathResult {
    return dir_for(DirectoryKind::DataLocal, app);
}

auto AppPathDeriver::favorites_dir_for(std::string_view app) const -> PathResult {
    return dir_for(DirectoryKind::Favorites, app);
}

auto AppPathDeriver::preference_dir_for(std::string_view app) const -> PathResult {
    return dir_for(DirectoryKind::Preferences, app);
}

auto AppPathDeriver::template_dir_for(std::string_view app) const -> PathResult {
    return dir_for(DirectoryKind::Template, app);
}

auto AppPathDeriver::log_dir_for(std::string_view app) const -> PathResult {
    return dir_for(DirectoryKind::Log, app);
}

auto AppPathDeriver::application_dir() const -> PathResult {
    return install_dir(DirectoryKind::Application);
}

auto AppPathDeriver::application_shared_dir() const -> PathResult {
    return install_dir(DirectoryKind::ApplicationShared);
}

auto AppPathDeriver::user_application_dir() const -> PathResult {
    return install_dir(DirectoryKind::UserApplication);
}

auto AppPathDeriver::app_container_dir_for(std::string_view app) const -> PathResult {
    return dir_for(DirectoryKind::AppContainer, app);
}

auto AppPathDeriver::app_container_executable_dir_for(std::string_view app) const
    -> PathResult {
    return dir_for(DirectoryKind::AppContainerExecutable, app);
}

auto AppPathDeriver::user_app_container_dir_for(std::string_view app) const -> PathResult {
    return dir_for(DirectoryKind::UserAppContainer, app);
}

auto AppPathDeriver::user_app_container_executable_dir_for(std::string_view app) const
    -> PathResult {
    return dir_for(DirectoryKind::UserAppContainerExecutable, app);
}

} // namespace appdirs
