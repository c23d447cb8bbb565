#include "appdirs/infra/environment.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#else
#include <sys/types.h>
#include <pwd.h>
#include <unistd.h>
#endif

namespace appdirs::infra {

namespace fs = std::filesystem;

auto Environment::home_dir() const -> std::optional<fs::path> {
    if (auto home = get("HOME"); home && !home->empty()) {
        return fs::path(*home);
    }
    return std::nullopt;
}

auto ProcessEnvironment::get(std::string_view name) const -> std::optional<std::string> {
    std::string key(name);
    if (const auto* val = std::getenv(key.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

auto ProcessEnvironment::home_dir() const -> std::optional<fs::path> {
#ifdef _WIN32
    if (const auto* home = std::getenv("USERPROFILE"); home && *home) {
        return fs::path(home);
    }
    const auto* drive = std::getenv("HOMEDRIVE");
    const auto* hpath = std::getenv("HOMEPATH");
    if (drive && hpath && *drive && *hpath) {
        return fs::path(std::string(drive) + hpath);
    }
    return std::nullopt;
#else
    if (const auto* home = std::getenv("HOME"); home && *home) {
        return fs::path(home);
    }

    // Fall back to passwd entry
    if (const auto* pw = ::getpwuid(::getuid()); pw && pw->pw_dir && *pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }
    return std::nullopt;
#endif
}

void MapEnvironment::set(std::string name, std::string value) {
    vars_[std::move(name)] = std::move(value);
}

void MapEnvironment::unset(const std::string& name) {
    vars_.erase(name);
}

auto MapEnvironment::get(std::string_view name) const -> std::optional<std::string> {
    if (auto it = vars_.find(std::string(name)); it != vars_.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace appdirs::infra
