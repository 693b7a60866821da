#ifndef UTILS_HPP
#define UTILS_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);
// Forward slashes on every platform
std::string generic_utf8(const std::filesystem::path& path);

std::string to_lower_copy(std::string value);
std::string trim_copy(const std::string& value);

// Splits a comma-separated list, trimming items and dropping empty ones.
std::vector<std::string> parse_list(const std::string& value);
std::string join_list(const std::vector<std::string>& items, const std::string& separator = ",");

}

#endif
