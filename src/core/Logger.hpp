/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * Owns the process-wide spdlog logger (console + rotating file) and provides
 * the LOG_* macros which carry source location into the file sink.
 *
 * @section Dependencies
 * - spdlog
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace babel {

class Logger {
public:
    static void init(std::string_view appName = "babel-player",
                     bool debug = false);
    static void setDebug(bool debug);
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(babel::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(babel::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(babel::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(babel::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(babel::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) \
    SPDLOG_LOGGER_CRITICAL(babel::Logger::get(), __VA_ARGS__)

} // namespace babel
