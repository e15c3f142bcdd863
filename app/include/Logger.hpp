#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

class Logger {
public:
    // Creates core_logger, store_logger and cli_logger writing to <log_dir>/camera-sorter.log
    // and stdout. Throws spdlog::spdlog_ex when the log directory cannot be used.
    static void setup_loggers(const std::string& log_dir);

    // Returns nullptr until setup_loggers() registered the logger.
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    // Applies a configured level name unless CAMERA_SORTER_LOG_LEVEL is set.
    static void apply_configured_level(const std::string& level_name);

    static std::string get_log_file_path();

private:
    static std::string log_file_path;
};

#endif
