#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include "appdirs/core/types.hpp"
#include "appdirs/infra/environment.hpp"

namespace appdirs::providers {

/// Abstract source of platform base directories.
///
/// Each implementation knows where one operating system keeps a given kind
/// of directory (XDG on Linux, Standard Directories on macOS, Known Folders
/// on Windows). Absence is an ordinary answer: the kind has no standard
/// location there. Implementations never throw and never touch the
/// filesystem beyond reading configuration.
class BaseDirectoryProvider {
public:
    virtual ~BaseDirectoryProvider() = default;

    /// Base directory for `kind`, or nullopt if the platform defines none.
    [[nodiscard]] virtual auto base_path(DirectoryKind kind) const
        -> std::optional<std::filesystem::path> = 0;

    /// Short provider name used in logs (e.g. "xdg", "known-folder").
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

/// Returns the provider for the host platform, reading `env`.
auto make_host_provider(std::shared_ptr<const infra::Environment> env)
    -> std::shared_ptr<const BaseDirectoryProvider>;

} // namespace appdirs::providers
