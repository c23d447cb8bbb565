#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string_view>

#include "appdirs/core/config.hpp"
#include "appdirs/providers/provider.hpp"

namespace appdirs::providers {

/// Layers explicit base directories over another provider. Kinds without an
/// override are answered by the fallback.
class OverrideProvider final : public BaseDirectoryProvider {
public:
    OverrideProvider(std::map<DirectoryKind, std::filesystem::path> overrides,
                     std::shared_ptr<const BaseDirectoryProvider> fallback);

    [[nodiscard]] auto base_path(DirectoryKind kind) const
        -> std::optional<std::filesystem::path> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "override"; }

private:
    std::map<DirectoryKind, std::filesystem::path> overrides_;
    std::shared_ptr<const BaseDirectoryProvider> fallback_;
};

/// Builds an OverrideProvider from `config`. Override values have their
/// `${VAR}` references resolved against `env`; entries with an unknown kind
/// or a result that is not absolute on `platform` are skipped with a warning.
auto make_override_provider(const Config& config, Platform platform,
                            const infra::Environment& env,
                            std::shared_ptr<const BaseDirectoryProvider> fallback)
    -> std::shared_ptr<const OverrideProvider>;

} // namespace appdirs::providers
