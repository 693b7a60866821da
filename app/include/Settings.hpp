#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <SensitiveContentClassifier.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>


class Settings
{
public:
    Settings();
    explicit Settings(std::string config_path);

    // Returns false (keeping defaults) when the file is missing or unreadable
    bool load();
    bool save();

    static std::string define_config_path();
    std::string get_config_path() const;
    std::string get_config_dir() const;

    // std::nullopt means the built-in forbidden-root table
    std::optional<std::vector<std::string>> get_forbidden_roots() const;
    void set_forbidden_roots(std::optional<std::vector<std::string>> roots);

    std::vector<std::string> get_extra_sensitive_directories() const;
    void set_extra_sensitive_directories(std::vector<std::string> values);
    std::vector<std::string> get_extra_sensitive_patterns() const;
    void set_extra_sensitive_patterns(std::vector<std::string> values);
    std::vector<std::string> get_extra_sensitive_extensions() const;
    void set_extra_sensitive_extensions(std::vector<std::string> values);
    SensitivityRules get_sensitivity_rules() const;

    // std::nullopt means unbounded
    std::optional<std::size_t> get_max_depth() const;
    void set_max_depth(std::optional<std::size_t> value);
    std::optional<std::size_t> get_max_files() const;
    void set_max_files(std::optional<std::size_t> value);

    std::string get_log_level() const;
    void set_log_level(const std::string& value);
    std::string get_log_dir() const;
    void set_log_dir(const std::string& value);

private:
    std::string config_path;
    IniConfig config;

    std::optional<std::vector<std::string>> forbidden_roots;
    std::vector<std::string> extra_sensitive_directories;
    std::vector<std::string> extra_sensitive_patterns;
    std::vector<std::string> extra_sensitive_extensions;
    std::optional<std::size_t> max_depth;
    std::optional<std::size_t> max_files;
    std::string log_level{"info"};
    std::string log_dir;
};

#endif
