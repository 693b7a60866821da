#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path)
{
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
}

std::filesystem::path utf8_to_path(const std::string& value)
{
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}

std::string generic_utf8(const std::filesystem::path& path)
{
    const auto u8 = path.generic_u8string();
    return std::string(u8.begin(), u8.end());
}

std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(const std::string& value)
{
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    const auto begin = std::find_if(value.begin(), value.end(), not_space);
    const auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::vector<std::string> parse_list(const std::string& value)
{
    std::vector<std::string> result;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim_copy(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::string join_list(const std::vector<std::string>& items, const std::string& separator)
{
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << separator;
        }
        oss << items[i];
    }
    return oss.str();
}

}
