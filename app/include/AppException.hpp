#ifndef APPEXCEPTION_HPP
#define APPEXCEPTION_HPP

#include "ErrorCode.hpp"
#include "Types.hpp"
#include <stdexcept>
#include <utility>
#include <string>

namespace ErrorCodes {

/**
 * @brief Exception carrying a catalogued error code.
 *
 * what() is the generic, user-facing text (message and resolution). Paths
 * and other technical context are kept out of it and only appear in
 * get_full_details(), which is meant for the log.
 */
class AppException : public std::runtime_error {
public:
    explicit AppException(Code code, const std::string& context = "")
        : AppException(ErrorCatalog::get_error_info(code, context)) {}

    // The custom message replaces the catalog text; the resolution is kept.
    AppException(Code code, const std::string& custom_message, const std::string& context)
        : AppException(ErrorInfo(code, custom_message,
                                 ErrorCatalog::get_error_info(code).resolution, context)) {}

    Code get_error_code() const noexcept { return info_.code; }
    int get_error_code_int() const noexcept { return static_cast<int>(info_.code); }
    BoundaryErrorKind kind() const { return kind_of(info_.code); }

    const ErrorInfo& get_error_info() const noexcept { return info_; }
    const std::string& get_context() const noexcept { return info_.context; }
    std::string get_full_details() const { return info_.get_full_details(); }

private:
    explicit AppException(ErrorInfo info)
        : std::runtime_error(info.get_user_message()),
          info_(std::move(info)) {}

    ErrorInfo info_;
};

} // namespace ErrorCodes

#define THROW_APP_ERROR(code, context) \
    throw ErrorCodes::AppException(code, context)

#endif // APPEXCEPTION_HPP
