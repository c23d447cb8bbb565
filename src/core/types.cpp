#include "appdirs/core/types.hpp"

namespace appdirs {

auto to_string(DirectoryKind kind) -> std::string_view {
    switch (kind) {
        case DirectoryKind::Cache: return "cache";
        case DirectoryKind::Config: return "config";
        case DirectoryKind::Data: return "data";
        case DirectoryKind::DataLocal: return "data_local";
        case DirectoryKind::Favorites: return "favorites";
        case DirectoryKind::Preferences: return "preferences";
        case DirectoryKind::Template: return "template";
        case DirectoryKind::Log: return "log";
        case DirectoryKind::Application: return "application";
        case DirectoryKind::ApplicationShared: return "application_shared";
        case DirectoryKind::UserApplication: return "user_application";
        case DirectoryKind::AppContainer: return "app_container";
        case DirectoryKind::AppContainerExecutable: return "app_container_executable";
        case DirectoryKind::UserAppContainer: return "user_app_container";
        case DirectoryKind::UserAppContainerExecutable: return "user_app_container_executable";
    }
    return "unknown";
}

auto to_string(Platform platform) -> std::string_view {
    switch (platform) {
        case Platform::Linux: return "linux";
        case Platform::Windows: return "windows";
        case Platform::MacOS: return "macos";
    }
    return "unknown";
}

auto directory_kind_from_string(std::string_view name) -> std::optional<DirectoryKind> {
    for (auto kind : kAllDirectoryKinds) {
        if (to_string(kind) == name) return kind;
    }
    return std::nullopt;
}

} // namespace appdirs
