#include "appdirs/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace appdirs {

namespace {

constexpr std::string_view kLoggerName = "appdirs";

auto make_logger() -> std::shared_ptr<spdlog::logger> {
    const std::string name(kLoggerName);
    // A host application may already have registered a logger under our name.
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    try {
        auto logger = spdlog::stdout_color_mt(name);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
        logger->set_level(spdlog::level::info);
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        // Registered by the host between the lookup and our registration.
        return spdlog::get(name);
    }
}

} // anonymous namespace

auto Logger::get() -> const std::shared_ptr<spdlog::logger>& {
    static const std::shared_ptr<spdlog::logger> logger = make_logger();
    return logger;
}

void Logger::set_level(std::string_view level) {
    const auto& logger = get();
    if (level == "trace") logger->set_level(spdlog::level::trace);
    else if (level == "debug") logger->set_level(spdlog::level::debug);
    else if (level == "info") logger->set_level(spdlog::level::info);
    else if (level == "warn") logger->set_level(spdlog::level::warn);
    else if (level == "error") logger->set_level(spdlog::level::err);
    else if (level == "critical") logger->set_level(spdlog::level::critical);
    else if (level == "off") logger->set_level(spdlog::level::off);
    else logger->set_level(spdlog::level::info);
}

} // namespace appdirs
