#include "ErrorCode.hpp"

#include <sstream>
#include <unordered_map>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    const char* name;
    const char* message;
    const char* resolution;
};

const std::unordered_map<Code, CatalogEntry>& catalog()
{
    static const std::unordered_map<Code, CatalogEntry> entries = {
        {Code::UNKNOWN_ERROR,
         {"UNKNOWN_ERROR", "An unexpected error occurred.",
          "Re-run with --verbose and check the log output."}},
        {Code::ROOT_NOT_FOUND,
         {"ROOT_NOT_FOUND", "The project directory does not exist.",
          "Check the path and try again."}},
        {Code::ROOT_NOT_DIRECTORY,
         {"ROOT_NOT_DIRECTORY", "The project path is not a directory.",
          "Point the scanner at the project's top-level folder."}},
        {Code::ROOT_FORBIDDEN,
         {"ROOT_FORBIDDEN", "Cannot analyze system directory.",
          "System directories are forbidden for security. Choose a project directory instead."}},
        {Code::PATH_OUTSIDE_ROOT,
         {"PATH_OUTSIDE_ROOT", "Path traversal detected: the path is outside the project root.",
          "Only paths inside the project directory can be accessed."}},
        {Code::SYMLINK_ATTACK,
         {"SYMLINK_ATTACK", "Symlink attack detected: the link target is outside the project root.",
          "Remove the link or replace it with a link to a file inside the project."}},
        {Code::SYMLINK_OUTSIDE_ROOT,
         {"SYMLINK_OUTSIDE_ROOT", "Symlink points outside the project and was skipped.",
          "No action needed; the entry is excluded from the scan."}},
        {Code::SYMLINK_UNRESOLVABLE,
         {"SYMLINK_UNRESOLVABLE", "Cannot resolve symlink.",
          "Check for link loops or dangling links."}},
        {Code::PATH_NOT_FOUND,
         {"PATH_NOT_FOUND", "Path does not exist.",
          "The file may have been moved or deleted during the scan."}},
        {Code::PERMISSION_DENIED,
         {"PERMISSION_DENIED", "Permission denied.",
          "Grant read access to the directory or exclude it from the scan."}},
        {Code::NOT_A_DIRECTORY,
         {"NOT_A_DIRECTORY", "Not a directory.",
          "Pass a directory path."}},
        {Code::FILESYSTEM_ERROR,
         {"FILESYSTEM_ERROR", "A file system error occurred.",
          "Check disk health and mount status."}},
        {Code::CONFIG_LOAD_FAILED,
         {"CONFIG_LOAD_FAILED", "Failed to load configuration file.",
          "Check that the configuration file exists and is readable."}},
        {Code::CONFIG_INVALID_PATTERN,
         {"CONFIG_INVALID_PATTERN", "Custom sensitive-file pattern is not a valid regular expression.",
          "Fix or remove the pattern from [Sensitivity] extra_patterns."}},
    };
    return entries;
}

} // namespace

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return message + "\n" + resolution;
}

std::string ErrorInfo::get_full_details() const
{
    std::ostringstream oss;
    oss << "Error " << static_cast<int>(code) << " (" << ErrorCatalog::code_name(code) << "): "
        << message;
    if (!resolution.empty()) {
        oss << "\nResolution: " << resolution;
    }
    if (!context.empty()) {
        oss << "\nDetails: " << context;
    }
    return oss.str();
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entries = catalog();
    auto it = entries.find(code);
    if (it == entries.end()) {
        it = entries.find(Code::UNKNOWN_ERROR);
    }
    return ErrorInfo(code, it->second.message, it->second.resolution, context);
}

std::string ErrorCatalog::code_name(Code code)
{
    const auto& entries = catalog();
    if (auto it = entries.find(code); it != entries.end()) {
        return it->second.name;
    }
    return "UNKNOWN_ERROR";
}

} // namespace ErrorCodes
