#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cdpflow {

class Logger {
public:
    static void init(std::string_view name = "cdpflow", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace cdpflow

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::cdpflow::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::cdpflow::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::cdpflow::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::cdpflow::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::cdpflow::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::cdpflow::Logger::get(), __VA_ARGS__)
