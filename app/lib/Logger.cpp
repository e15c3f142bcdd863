#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

std::string Logger::log_file_path;

namespace {

constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

spdlog::level::level_enum resolve_level()
{
    if (const char* value = std::getenv("CAMERA_SORTER_LOG_LEVEL")) {
        const auto level = spdlog::level::from_str(value);
        // from_str falls back to "off" for unknown names
        if (level != spdlog::level::off || std::string(value) == "off") {
            return level;
        }
    }
    return spdlog::level::info;
}

}


void Logger::setup_loggers(const std::string& log_dir)
{
    std::filesystem::create_directories(log_dir);
    log_file_path = (std::filesystem::path(log_dir) / "camera-sorter.log").string();

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file_path, kMaxLogFileSize, kMaxLogFiles);
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    const std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};
    const auto level = resolve_level();

    for (const char* name : {"core_logger", "store_logger", "cli_logger"}) {
        spdlog::drop(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::apply_configured_level(const std::string& level_name)
{
    if (std::getenv("CAMERA_SORTER_LOG_LEVEL") || level_name.empty()) {
        return;
    }
    const auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        if (auto logger = get_logger("core_logger")) {
            logger->warn("Unknown log level '{}' in configuration", level_name);
        }
        return;
    }
    for (const char* name : {"core_logger", "store_logger", "cli_logger"}) {
        if (auto logger = get_logger(name)) {
            logger->set_level(level);
        }
    }
}


std::string Logger::get_log_file_path()
{
    return log_file_path;
}
