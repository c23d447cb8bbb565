#include "appdirs/appdirs.hpp"
#include "appdirs/core/logger.hpp"
#include "appdirs/providers/override.hpp"

namespace appdirs {

auto host_deriver() -> const AppPathDeriver& {
    static const AppPathDeriver deriver(
        current_platform(),
        providers::make_host_provider(std::make_shared<infra::ProcessEnvironment>()));
    return deriver;
}

auto make_deriver(const Config& config, std::shared_ptr<const infra::Environment> env)
    -> AppPathDeriver {
    Logger::set_level(config.log_level);
    auto fallback = providers::make_host_provider(env);
    return AppPathDeriver(current_platform(),
                          providers::make_override_provider(config, current_platform(), *env,
                                                            std::move(fallback)));
}

auto cache_dir() -> PathResult { return host_deriver().cache_dir(); }
auto config_dir() -> PathResult { return host_deriver().config_dir(); }
auto data_dir() -> PathResult { return host_deriver().data_dir(); }
auto data_local_dir() -> PathResult { return host_deriver().data_local_dir(); }

auto cache_dir_for(std::string_view app) -> PathResult {
    return host_deriver().cache_dir_for(app);
}

auto config_dir_for(std::string_view app) -> PathResult {
    return host_deriver().config_dir_for(app);
}

auto data_dir_for(std::string_view app) -> PathResult {
    return host_deriver().data_dir_for(app);
}

auto data_local_dir_for(std::string_view app) -> PathResult {
    return host_deriver().data_local_dir_for(app);
}

auto favorites_dir_for(std::string_view app) -> PathResult {
    return host_deriver().favorites_dir_for(app);
}

auto preference_dir_for(std::string_view app) -> PathResult {
    return host_deriver().preference_dir_for(app);
}

auto template_dir_for(std::string_view app) -> PathResult {
    return host_deriver().template_dir_for(app);
}

auto log_dir_for(std::string_view app) -> PathResult {
    return host_deriver().log_dir_for(app);
}

auto application_dir() -> PathResult { return host_deriver().application_dir(); }
auto application_shared_dir() -> PathResult { return host_deriver().application_shared_dir(); }
auto user_application_dir() -> PathResult { return host_deriver().user_application_dir(); }

auto app_container_dir_for(std::string_view app) -> PathResult {
    return host_deriver().app_container_dir_for(app);
}

auto app_container_executable_dir_for(std::string_view app) -> PathResult {
    return host_deriver().app_container_executable_dir_for(app);
}

auto user_app_container_dir_for(std::string_view app) -> PathResult {
    return host_deriver().user_app_container_dir_for(app);
}

auto user_app_container_executable_dir_for(std::string_view app) -> PathResult {
    return host_deriver().user_app_container_executable_dir_for(app);
}

} // namespace appdirs
