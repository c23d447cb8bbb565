#include "appdirs/providers/provider.hpp"

#if defined(_WIN32)
#include "appdirs/providers/known_folder.hpp"
#elif defined(__APPLE__)
#include "appdirs/providers/standard_directories.hpp"
#else
#include "appdirs/providers/xdg.hpp"
#endif

namespace appdirs::providers {

auto make_host_provider(std::shared_ptr<const infra::Environment> env)
    -> std::shared_ptr<const BaseDirectoryProvider> {
#if defined(_WIN32)
    (void)env;
    return std::make_shared<KnownFolderProvider>();
#elif defined(__APPLE__)
    return std::make_shared<StandardDirectoryProvider>(std::move(env));
#else
    return std::make_shared<XdgProvider>(std::move(env));
#endif
}

} // namespace appdirs::providers
