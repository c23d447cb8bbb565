#pragma once

#include <filesystem>
#include <string_view>

#include "appdirs/core/types.hpp"

namespace appdirs::infra {

/// Preferred directory separator on `platform` ('\\' on Windows, '/' elsewhere).
constexpr auto separator_for(Platform platform) noexcept -> std::filesystem::path::value_type {
    return platform == Platform::Windows ? std::filesystem::path::value_type('\\')
                                         : std::filesystem::path::value_type('/');
}

/// Path from UTF-8 text. On Windows the narrow-string path constructor would
/// go through the ANSI code page instead.
auto path_from_utf8(std::string_view text) -> std::filesystem::path;

/// Appends exactly one segment to `base` using the separator of `platform`,
/// independent of the host the code runs on. The segment is UTF-8 and is not
/// otherwise inspected:
/// an empty segment leaves a trailing separator.
auto join_segment(const std::filesystem::path& base, std::string_view segment,
                  Platform platform) -> std::filesystem::path;

/// Whether `path` is absolute under the rules of `platform`.
/// Windows accepts drive-absolute (`C:\`, `C:/`) and UNC (`\\server`) paths.
auto is_absolute_for(const std::filesystem::path& path, Platform platform) -> bool;

} // namespace appdirs::infra
