#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace appdirs {

/// The library's spdlog logger, named "appdirs". Created on first use; safe to
/// call from any thread.
class Logger {
public:
    static auto get() -> const std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
};

} // namespace appdirs

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::appdirs::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::appdirs::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::appdirs::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::appdirs::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::appdirs::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::appdirs::Logger::get(), __VA_ARGS__)
