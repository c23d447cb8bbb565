#pragma once

#include <filesystem>
#include <initializer_list>
#include <map>
#include <string_view>
#include <utility>

#include "appdirs/providers/provider.hpp"

namespace appdirs::providers {

/// Answers from a fixed table of base directories. Kinds missing from the
/// table are absent.
class StaticProvider final : public BaseDirectoryProvider {
public:
    StaticProvider() = default;
    explicit StaticProvider(std::map<DirectoryKind, std::filesystem::path> paths)
        : paths_(std::move(paths)) {}
    StaticProvider(std::initializer_list<std::pair<const DirectoryKind, std::filesystem::path>> paths)
        : paths_(paths) {}

    void set(DirectoryKind kind, std::filesystem::path path);

    [[nodiscard]] auto base_path(DirectoryKind kind) const
        -> std::optional<std::filesystem::path> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "static"; }

private:
    std::map<DirectoryKind, std::filesystem::path> paths_;
};

} // namespace appdirs::providers
