#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

struct LoggerOptions {
    spdlog::level::level_enum level{spdlog::level::info};
    // Empty disables the rotating file sink
    std::string log_dir;
};

class Logger {
public:
    // Registers "core_logger". Throws spdlog::spdlog_ex when a sink cannot be created.
    static void setup_loggers(const LoggerOptions& options = {});
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);
    static spdlog::level::level_enum parse_level(const std::string& value,
                                                 spdlog::level::level_enum fallback);

private:
    static std::string log_file_path(const std::string& log_dir);
};

#endif
