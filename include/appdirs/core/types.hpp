#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace appdirs {

/// Category of directory a caller asks for.
enum class DirectoryKind {
    Cache,
    Config,
    Data,
    DataLocal,
    Favorites,
    Preferences,
    Template,
    Log,
    Application,
    ApplicationShared,
    UserApplication,
    AppContainer,
    AppContainerExecutable,
    UserAppContainer,
    UserAppContainerExecutable,
};

inline constexpr std::array<DirectoryKind, 15> kAllDirectoryKinds = {
    DirectoryKind::Cache,
    DirectoryKind::Config,
    DirectoryKind::Data,
    DirectoryKind::DataLocal,
    DirectoryKind::Favorites,
    DirectoryKind::Preferences,
    DirectoryKind::Template,
    DirectoryKind::Log,
    DirectoryKind::Application,
    DirectoryKind::ApplicationShared,
    DirectoryKind::UserApplication,
    DirectoryKind::AppContainer,
    DirectoryKind::AppContainerExecutable,
    DirectoryKind::UserAppContainer,
    DirectoryKind::UserAppContainerExecutable,
};

/// Host operating system family. Linux covers every XDG-style Unix.
enum class Platform {
    Linux,
    Windows,
    MacOS,
};

inline constexpr std::array<Platform, 3> kAllPlatforms = {
    Platform::Linux,
    Platform::Windows,
    Platform::MacOS,
};

/// The platform this library was compiled for.
constexpr auto current_platform() noexcept -> Platform {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

/// Configuration name of `kind` ("cache", "data_local", ...). The switch in
/// to_string is the only name table; directory_kind_from_string inverts it.
auto to_string(DirectoryKind kind) -> std::string_view;
auto to_string(Platform platform) -> std::string_view;

auto directory_kind_from_string(std::string_view name) -> std::optional<DirectoryKind>;

/// True for the kinds that also have an application-independent form
/// (cache, config, data, data_local).
constexpr auto has_generic_form(DirectoryKind kind) noexcept -> bool {
    switch (kind) {
        case DirectoryKind::Cache:
        case DirectoryKind::Config:
        case DirectoryKind::Data:
        case DirectoryKind::DataLocal:
            return true;
        case DirectoryKind::Favorites:
        case DirectoryKind::Preferences:
        case DirectoryKind::Template:
        case DirectoryKind::Log:
        case DirectoryKind::Application:
        case DirectoryKind::ApplicationShared:
        case DirectoryKind::UserApplication:
        case DirectoryKind::AppContainer:
        case DirectoryKind::AppContainerExecutable:
        case DirectoryKind::UserAppContainer:
        case DirectoryKind::UserAppContainerExecutable:
            return false;
    }
    return false;
}

/// True for the install-location kinds, which never take an application name.
constexpr auto is_install_location(DirectoryKind kind) noexcept -> bool {
    return kind == DirectoryKind::Application ||
           kind == DirectoryKind::ApplicationShared ||
           kind == DirectoryKind::UserApplication;
}

} // namespace appdirs
