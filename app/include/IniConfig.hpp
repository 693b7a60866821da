#ifndef INICONFIG_HPP
#define INICONFIG_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

class IniConfig {
public:
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section, const std::string& key,
                         const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    bool hasValue(const std::string& section, const std::string& key) const;

    // Comma-separated list; empty when the key is absent.
    std::vector<std::string> getList(const std::string& section, const std::string& key) const;

    // Non-negative integer; std::nullopt when absent or malformed.
    std::optional<std::size_t> getSize(const std::string& section, const std::string& key) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif
