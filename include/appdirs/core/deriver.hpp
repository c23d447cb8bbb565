#pragma once

#include <filesystem>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string_view>

#include "appdirs/core/types.hpp"
#include "appdirs/providers/provider.hpp"

namespace appdirs {

using PathResult = std::optional<std::filesystem::path>;

/// Derives application-specific directories from platform base directories.
///
/// The deriver owns no state besides the platform whose join rules it
/// applies and the provider it asks for base directories, so a single
/// instance can be shared freely between threads. Nothing here touches the
/// filesystem: directories are neither created nor checked for existence.
///
/// The application name is used verbatim as a path segment. Names containing
/// separators or characters the platform forbids produce a well-formed but
/// unusable path; validating them is the caller's job.
class AppPathDeriver {
public:
    AppPathDeriver(Platform platform,
                   std::shared_ptr<const providers::BaseDirectoryProvider> provider);

    [[nodiscard]] auto platform() const noexcept -> Platform { return platform_; }

    /// Application-independent form of cache, config, data and data_local.
    /// Absent for every other kind.
    [[nodiscard]] auto generic_dir(DirectoryKind kind) const -> PathResult;

    /// Application-specific directory of `kind` for `app`. Absent when the
    /// platform has no such location or the kind takes no application name.
    [[nodiscard]] auto dir_for(DirectoryKind kind, std::string_view app) const -> PathResult;

    /// Installed-application location (application, application_shared,
    /// user_application). Absent for every other kind.
    [[nodiscard]] auto install_dir(DirectoryKind kind) const -> PathResult;

    [[nodiscard]] auto cache_dir() const -> PathResult;
    [[nodiscard]] auto config_dir() const -> PathResult;
    [[nodiscard]] auto data_dir() const -> PathResult;
    [[nodiscard]] auto data_local_dir() const -> PathResult;

    [[nodiscard]] auto cache_dir_for(std::string_view app) const -> PathResult;
    [[nodiscard]] auto config_dir_for(std::string_view app) const -> PathResult;
    [[nodiscard]] auto data_dir_for(std::string_view app) const -> PathResult;
    [[nodiscard]] auto data_local_dir_for(std::string_view app) const -> PathResult;
    [[nodiscard]] auto favorites_dir_for(std::string_view app) const -> PathResult;
    [[nodiscard]] auto preference_dir_for(std::string_view app) const -> PathResult;
    [[nodiscard]] auto template_dir_for(std::string_view app) const -> PathResult;
    [[nodiscard]] auto log_dir_for(std::string_view app) const -> PathResult;

    [[nodiscard]] auto application_dir() const -> PathResult;
    [[nodiscard]] auto application_shared_dir() const -> PathResult;
    [[nodiscard]] auto user_application_dir() const -> PathResult;

    /// macOS only; absent on every other platform.
    [[nodiscard]] auto app_container_dir_for(std::string_view app) const -> PathResult;
    [[nodiscard]] auto app_container_executable_dir_for(std::string_view app) const -> PathResult;
    [[nodiscard]] auto user_app_container_dir_for(std::string_view app) const -> PathResult;
    [[nodiscard]] auto user_app_container_executable_dir_for(std::string_view app) const
        -> PathResult;

private:
    auto derive_xdg(DirectoryKind kind, std::string_view app) const -> PathResult;
    auto derive_windows(DirectoryKind kind, std::string_view app) const -> PathResult;
    auto derive_macos(DirectoryKind kind, std::string_view app) const -> PathResult;

    /// base_path(kind) joined with each of `segments` in turn.
    auto under(DirectoryKind kind, std::initializer_list<std::string_view> segments) const
        -> PathResult;
    auto join(PathResult base, std::initializer_list<std::string_view> segments) const
        -> PathResult;

    Platform platform_;
    std::shared_ptr<const providers::BaseDirectoryProvider> provider_;
};

} // namespace appdirs
