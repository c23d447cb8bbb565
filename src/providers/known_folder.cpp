#include "appdirs/providers/known_folder.hpp"
#include "appdirs/core/logger.hpp"

#include <windows.h>
#include <knownfolders.h>
#include <shlobj.h>

namespace appdirs::providers {

namespace fs = std::filesystem;

namespace {

auto known_folder(REFKNOWNFOLDERID id, std::string_view label) -> std::optional<fs::path> {
    PWSTR path_w = nullptr;
    const HRESULT hr = ::SHGetKnownFolderPath(id, KF_FLAG_DEFAULT, nullptr, &path_w);
    if (hr != S_OK || !path_w) {
        // The out pointer must be freed even on failure.
        ::CoTaskMemFree(path_w);
        LOG_DEBUG("Known folder {} unavailable (hr=0x{:08x})", label,
                  static_cast<unsigned long>(hr));
        return std::nullopt;
    }
    fs::path out(path_w);
    ::CoTaskMemFree(path_w);
    return out;
}

} // anonymous namespace

auto KnownFolderProvider::base_path(DirectoryKind kind) const -> std::optional<fs::path> {
    switch (kind) {
        case DirectoryKind::Cache:
        case DirectoryKind::DataLocal:
            return known_folder(FOLDERID_LocalAppData, "LocalAppData");
        case DirectoryKind::Config:
        case DirectoryKind::Data:
        case DirectoryKind::Preferences:
            return known_folder(FOLDERID_RoamingAppData, "RoamingAppData");
        case DirectoryKind::Favorites:
            return known_folder(FOLDERID_Favorites, "Favorites");
        case DirectoryKind::Template:
            return known_folder(FOLDERID_Templates, "Templates");
        case DirectoryKind::Log: {
            auto local = known_folder(FOLDERID_LocalAppData, "LocalAppData");
            if (!local) return std::nullopt;
            return *local / L"Logs";
        }
        case DirectoryKind::Application:
            return known_folder(FOLDERID_ProgramFiles, "ProgramFiles");
        case DirectoryKind::ApplicationShared:
            return known_folder(FOLDERID_ProgramFilesCommon, "ProgramFilesCommon");
        case DirectoryKind::UserApplication:
            return known_folder(FOLDERID_UserProgramFiles, "UserProgramFiles");
        case DirectoryKind::AppContainer:
        case DirectoryKind::AppContainerExecutable:
        case DirectoryKind::UserAppContainer:
        case DirectoryKind::UserAppContainerExecutable:
            return std::nullopt;
    }
    return std::nullopt;
}

} // namespace appdirs::providers
