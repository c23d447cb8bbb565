#pragma once

#include <memory>
#include <string_view>

#include "appdirs/providers/provider.hpp"

namespace appdirs::providers {

/// XDG Base Directory provider for Linux and the BSDs.
///
/// Cache, config and data homes come from `$XDG_*_HOME`, falling back to the
/// `$HOME` defaults when the variable is unset, empty or relative.
/// Favorites, preferences, templates and logs have no XDG base.
class XdgProvider final : public BaseDirectoryProvider {
public:
    explicit XdgProvider(std::shared_ptr<const infra::Environment> env);

    [[nodiscard]] auto base_path(DirectoryKind kind) const
        -> std::optional<std::filesystem::path> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "xdg"; }

private:
    auto xdg_home(std::string_view var, std::string_view fallback) const
        -> std::optional<std::filesystem::path>;

    std::shared_ptr<const infra::Environment> env_;
};

} // namespace appdirs::providers
