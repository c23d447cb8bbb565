#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include "appdirs/core/config.hpp"
#include "appdirs/core/deriver.hpp"
#include "appdirs/core/types.hpp"
#include "appdirs/infra/environment.hpp"

/// Platform-appropriate directories for application data.
///
/// The free functions below answer for the host platform, reading the
/// process environment on every call:
///
/// | Generic form     | Application-specific form |
/// | ---------------- | ------------------------- |
/// | `cache_dir`      | `cache_dir_for`           |
/// | `config_dir`     | `config_dir_for`          |
/// | `data_dir`       | `data_dir_for`            |
/// | `data_local_dir` | `data_local_dir_for`      |
/// | -                | `favorites_dir_for`       |
/// | -                | `preference_dir_for`      |
/// | -                | `template_dir_for`        |
/// | -                | `log_dir_for`             |
///
/// Installed applications: `application_dir`, `application_shared_dir`,
/// `user_application_dir`. Application containers and bundles (macOS only):
/// `app_container_dir_for`, `app_container_executable_dir_for`,
/// `user_app_container_dir_for`, `user_app_container_executable_dir_for`.
///
/// Example:
///
///     auto config = appdirs::config_dir_for("acme");   // ~/.config/acme on Linux
///     auto logs = appdirs::log_dir_for("acme");
///
/// For a non-host platform, fabricated base directories or configured
/// overrides, build an AppPathDeriver directly or use make_deriver().
namespace appdirs {

/// Deriver bound to the host platform, host provider and process environment.
auto host_deriver() -> const AppPathDeriver&;

/// Host deriver with the overrides from `config` applied. Also sets the
/// library log level from `config`.
auto make_deriver(const Config& config,
                              std::shared_ptr<const infra::Environment> env =
                                  std::make_shared<infra::ProcessEnvironment>())
    -> AppPathDeriver;

// Cache:      Linux $XDG_CACHE_HOME or ~/.cache, macOS ~/Library/Caches,
//             Windows {FOLDERID_LocalAppData}
// Config:     Linux $XDG_CONFIG_HOME or ~/.config,
//             macOS ~/Library/Application Support, Windows {FOLDERID_RoamingAppData}
// Data:       Linux $XDG_DATA_HOME or ~/.local/share,
//             macOS ~/Library/Application Support, Windows {FOLDERID_RoamingAppData}
// Data local: as Data, except Windows {FOLDERID_LocalAppData}
auto cache_dir() -> PathResult;
auto config_dir() -> PathResult;
auto data_dir() -> PathResult;
auto data_local_dir() -> PathResult;

/// `cache_dir()`/{app}.
auto cache_dir_for(std::string_view app) -> PathResult;
/// `config_dir()`/{app}.
auto config_dir_for(std::string_view app) -> PathResult;
/// `data_dir()`/{app}.
auto data_dir_for(std::string_view app) -> PathResult;
/// `data_local_dir()`/{app}.
auto data_local_dir_for(std::string_view app) -> PathResult;

/// macOS ~/Library/Favorites/{app}, Windows {FOLDERID_Favorites}\{app},
/// absent on Linux.
auto favorites_dir_for(std::string_view app) -> PathResult;

/// macOS ~/Library/Preferences/{app}, Windows {FOLDERID_RoamingAppData}\{app},
/// absent on Linux.
auto preference_dir_for(std::string_view app) -> PathResult;

/// macOS ~/Library/Application Support/{app}/Templates,
/// Windows {FOLDERID_Templates}\{app}, absent on Linux.
auto template_dir_for(std::string_view app) -> PathResult;

/// Linux `data_local_dir()`/{app}/logs, macOS ~/Library/Logs/{app},
/// Windows {FOLDERID_LocalAppData}\Logs\{app}.
auto log_dir_for(std::string_view app) -> PathResult;

/// Linux /opt, macOS /Applications, Windows {FOLDERID_ProgramFiles}.
auto application_dir() -> PathResult;
/// Linux /usr/lib, macOS /Library/Frameworks, Windows {FOLDERID_ProgramFilesCommon}.
auto application_shared_dir() -> PathResult;
/// Linux ~/.local/bin, macOS ~/Applications, Windows {FOLDERID_UserProgramFiles}.
auto user_application_dir() -> PathResult;

/// macOS ~/Library/Containers/{app}/Data.
auto app_container_dir_for(std::string_view app) -> PathResult;
/// macOS `app_container_dir_for(app)`/Contents/MacOS.
auto app_container_executable_dir_for(std::string_view app) -> PathResult;
/// macOS ~/Applications/{app}.app.
auto user_app_container_dir_for(std::string_view app) -> PathResult;
/// macOS ~/Applications/{app}.app/Contents/MacOS.
auto user_app_container_executable_dir_for(std::string_view app) -> PathResult;

} // namespace appdirs
