#pragma once

#include <string_view>

#include "appdirs/providers/provider.hpp"

namespace appdirs::providers {

/// Windows Known Folder provider, backed by SHGetKnownFolderPath.
/// Only built on Windows.
class KnownFolderProvider final : public BaseDirectoryProvider {
public:
    [[nodiscard]] auto base_path(DirectoryKind kind) const
        -> std::optional<std::filesystem::path> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "known-folder"; }
};

} // namespace appdirs::providers
