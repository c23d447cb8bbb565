#pragma once

#include <memory>
#include <string_view>

#include "appdirs/providers/provider.hpp"

namespace appdirs::providers {

/// macOS Standard Directories provider.
/// Per-user locations live under `$HOME/Library`; system locations are fixed.
class StandardDirectoryProvider final : public BaseDirectoryProvider {
public:
    explicit StandardDirectoryProvider(std::shared_ptr<const infra::Environment> env);

    [[nodiscard]] auto base_path(DirectoryKind kind) const
        -> std::optional<std::filesystem::path> override;
    [[nodiscard]] auto name() const -> std::string_view override {
        return "standard-directories";
    }

private:
    auto home_relative(std::string_view subpath) const -> std::optional<std::filesystem::path>;

    std::shared_ptr<const infra::Environment> env_;
};

} // namespace appdirs::providers
