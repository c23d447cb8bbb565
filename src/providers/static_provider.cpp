#include "appdirs/providers/static_provider.hpp"

namespace appdirs::providers {

void StaticProvider::set(DirectoryKind kind, std::filesystem::path path) {
    paths_[kind] = std::move(path);
}

auto StaticProvider::base_path(DirectoryKind kind) const
    -> std::optional<std::filesystem::path> {
    if (auto it = paths_.find(kind); it != paths_.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace appdirs::providers
