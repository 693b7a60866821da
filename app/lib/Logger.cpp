#include "Logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <vector>

namespace {
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
}

void Logger::setup_loggers(const LoggerOptions& options)
{
    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%^%l%$] %v");
    sinks.push_back(console_sink);

    if (!options.log_dir.empty()) {
        std::filesystem::create_directories(options.log_dir);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file_path(options.log_dir), kMaxLogFileSize, kMaxLogFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(file_sink);
    }

    spdlog::drop("core_logger");
    auto logger = std::make_shared<spdlog::logger>("core_logger", sinks.begin(), sinks.end());
    logger->set_level(options.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}

spdlog::level::level_enum Logger::parse_level(const std::string& value,
                                              spdlog::level::level_enum fallback)
{
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (lowered.empty()) {
        return fallback;
    }
    if (lowered == "warning") {
        return spdlog::level::warn;
    }
    const auto level = spdlog::level::from_str(lowered);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && lowered != "off") {
        return fallback;
    }
    return level;
}

std::string Logger::log_file_path(const std::string& log_dir)
{
    return (std::filesystem::path(log_dir) / "scanguard.log").string();
}
