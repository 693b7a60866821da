#ifndef ERRORCODE_HPP
#define ERRORCODE_HPP

#include <string>
#include <utility>

namespace ErrorCodes {

enum class Code {
    UNKNOWN_ERROR = 0,

    // File system / project boundary (1200-1299)
    ROOT_NOT_FOUND = 1200,
    ROOT_NOT_DIRECTORY = 1201,
    ROOT_FORBIDDEN = 1202,
    PATH_OUTSIDE_ROOT = 1210,
    SYMLINK_ATTACK = 1211,
    SYMLINK_OUTSIDE_ROOT = 1220,
    SYMLINK_UNRESOLVABLE = 1221,
    PATH_NOT_FOUND = 1222,
    PERMISSION_DENIED = 1223,
    NOT_A_DIRECTORY = 1224,
    FILESYSTEM_ERROR = 1225,

    // Configuration (1500-1599)
    CONFIG_LOAD_FAILED = 1500,
    CONFIG_INVALID_PATTERN = 1502
};

/**
 * @brief Message, resolution hint and technical context for one error code.
 */
struct ErrorInfo {
    Code code{Code::UNKNOWN_ERROR};
    std::string message;
    std::string resolution;
    std::string context;

    ErrorInfo() = default;
    ErrorInfo(Code code, std::string message, std::string resolution, std::string context = "")
        : code(code),
          message(std::move(message)),
          resolution(std::move(resolution)),
          context(std::move(context)) {}

    // Message plus resolution; never includes the technical context.
    std::string get_user_message() const;

    // Code, message, resolution and technical context, for logs.
    std::string get_full_details() const;
};

class ErrorCatalog {
public:
    static ErrorInfo get_error_info(Code code, const std::string& context = "");
    static std::string code_name(Code code);
};

} // namespace ErrorCodes

#endif // ERRORCODE_HPP
