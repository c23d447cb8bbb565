#include "appdirs/infra/paths.hpp"

#include <string>

namespace appdirs::infra {

namespace fs = std::filesystem;

namespace {

auto is_separator(fs::path::value_type c, Platform platform) -> bool {
    if (c == fs::path::value_type('/')) return true;
    return platform == Platform::Windows && c == fs::path::value_type('\\');
}

} // anonymous namespace

auto path_from_utf8(std::string_view text) -> fs::path {
    return fs::path(std::u8string(text.begin(), text.end()));
}

auto join_segment(const fs::path& base, std::string_view segment, Platform platform)
    -> fs::path {
    auto native = base.native();
    if (native.empty() || !is_separator(native.back(), platform)) {
        native += separator_for(platform);
    }
    native += path_from_utf8(segment).native();
    return fs::path(std::move(native));
}

auto is_absolute_for(const fs::path& path, Platform platform) -> bool {
    const auto& native = path.native();
    if (native.empty()) return false;

    if (platform != Platform::Windows) {
        return native.front() == fs::path::value_type('/');
    }

    // UNC: \\server\share or //server/share
    if (native.size() >= 2 && is_separator(native[0], platform) &&
        is_separator(native[1], platform)) {
        return true;
    }
    // Drive-absolute: C:\ or C:/
    if (native.size() >= 3 && native[1] == fs::path::value_type(':') &&
        is_separator(native[2], platform)) {
        auto letter = native[0];
        return (letter >= 'A' && letter <= 'Z') || (letter >= 'a' && letter <= 'z');
    }
    return false;
}

} // namespace appdirs::infra
