#include "Settings.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>


namespace {
template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

// 0 in the file means "no limit"
std::optional<std::size_t> limit_from(const std::optional<std::size_t>& value)
{
    if (!value || *value == 0) {
        return std::nullopt;
    }
    return value;
}

std::string limit_to_string(const std::optional<std::size_t>& value)
{
    return value ? std::to_string(*value) : std::string("0");
}
}


Settings::Settings()
    : Settings(define_config_path())
{
}

Settings::Settings(std::string path)
    : config_path(std::move(path))
{
}


std::string Settings::define_config_path()
{
    const std::string AppName = "ScanGuard";
    if (const char* override_root = std::getenv("SCANGUARD_CONFIG_DIR")) {
        std::filesystem::path base = override_root;
        return (base / AppName / "config.ini").string();
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (std::filesystem::path(xdg) / AppName / "config.ini").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.config/" + AppName + "/config.ini";
    }
    return "config.ini";
}


std::string Settings::get_config_path() const
{
    return config_path;
}


std::string Settings::get_config_dir() const
{
    return std::filesystem::path(config_path).parent_path().string();
}


bool Settings::load()
{
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        settings_log(spdlog::level::debug, "No configuration file at {}; using defaults", config_path);
        return false;
    }
    if (!config.load(config_path)) {
        return false;
    }

    if (config.hasValue("Boundary", "forbidden_roots")) {
        forbidden_roots = config.getList("Boundary", "forbidden_roots");
    } else {
        forbidden_roots.reset();
    }

    extra_sensitive_directories = config.getList("Sensitivity", "extra_directories");
    extra_sensitive_extensions = config.getList("Sensitivity", "extra_extensions");
    // Regexes may contain commas, so patterns are separated by ';;'
    extra_sensitive_patterns.clear();
    std::string patterns = config.getValue("Sensitivity", "extra_patterns");
    std::size_t start = 0;
    while (start <= patterns.size()) {
        const auto end = patterns.find(";;", start);
        const std::string item = Utils::trim_copy(
            patterns.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (!item.empty()) {
            extra_sensitive_patterns.push_back(item);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 2;
    }

    // An empty max_depth means unbounded; 0 keeps the walk at the root
    max_depth = config.getSize("Limits", "max_depth");
    max_files = limit_from(config.getSize("Limits", "max_files"));

    log_level = config.getValue("Logging", "level", "info");
    log_dir = config.getValue("Logging", "log_dir", "");

    settings_log(spdlog::level::debug, "Loaded configuration from {}", config_path);
    return true;
}


bool Settings::save()
{
    std::error_code ec;
    const std::filesystem::path dir = get_config_dir();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            settings_log(spdlog::level::err, "Error creating configuration directory: {}", ec.message());
            return false;
        }
    }

    if (forbidden_roots) {
        config.setValue("Boundary", "forbidden_roots", Utils::join_list(*forbidden_roots));
    }
    config.setValue("Sensitivity", "extra_directories", Utils::join_list(extra_sensitive_directories));
    config.setValue("Sensitivity", "extra_extensions", Utils::join_list(extra_sensitive_extensions));
    config.setValue("Sensitivity", "extra_patterns", Utils::join_list(extra_sensitive_patterns, ";;"));
    config.setValue("Limits", "max_depth", max_depth ? std::to_string(*max_depth) : std::string());
    config.setValue("Limits", "max_files", limit_to_string(max_files));
    config.setValue("Logging", "level", log_level);
    config.setValue("Logging", "log_dir", log_dir);

    return config.save(config_path);
}


std::optional<std::vector<std::string>> Settings::get_forbidden_roots() const
{
    return forbidden_roots;
}

void Settings::set_forbidden_roots(std::optional<std::vector<std::string>> roots)
{
    forbidden_roots = std::move(roots);
}

std::vector<std::string> Settings::get_extra_sensitive_directories() const
{
    return extra_sensitive_directories;
}

void Settings::set_extra_sensitive_directories(std::vector<std::string> values)
{
    extra_sensitive_directories = std::move(values);
}

std::vector<std::string> Settings::get_extra_sensitive_patterns() const
{
    return extra_sensitive_patterns;
}

void Settings::set_extra_sensitive_patterns(std::vector<std::string> values)
{
    extra_sensitive_patterns = std::move(values);
}

std::vector<std::string> Settings::get_extra_sensitive_extensions() const
{
    return extra_sensitive_extensions;
}

void Settings::set_extra_sensitive_extensions(std::vector<std::string> values)
{
    extra_sensitive_extensions = std::move(values);
}

SensitivityRules Settings::get_sensitivity_rules() const
{
    return SensitivityRules{extra_sensitive_patterns, extra_sensitive_directories, extra_sensitive_extensions};
}

std::optional<std::size_t> Settings::get_max_depth() const
{
    return max_depth;
}

void Settings::set_max_depth(std::optional<std::size_t> value)
{
    max_depth = value;
}

std::optional<std::size_t> Settings::get_max_files() const
{
    return max_files;
}

void Settings::set_max_files(std::optional<std::size_t> value)
{
    max_files = limit_from(value);
}

std::string Settings::get_log_level() const
{
    return log_level;
}

void Settings::set_log_level(const std::string& value)
{
    log_level = value;
}

std::string Settings::get_log_dir() const
{
    return log_dir;
}

void Settings::set_log_dir(const std::string& value)
{
    log_dir = value;
}
