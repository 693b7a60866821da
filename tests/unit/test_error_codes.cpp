#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "ErrorCode.hpp"
#include "Types.hpp"

#include <string>

using ErrorCodes::AppException;
using ErrorCodes::Code;
using ErrorCodes::ErrorCatalog;

TEST_CASE("error codes map onto boundary error kinds") {
    CHECK(kind_of(Code::ROOT_NOT_FOUND) == BoundaryErrorKind::InvalidRoot);
    CHECK(kind_of(Code::ROOT_NOT_DIRECTORY) == BoundaryErrorKind::InvalidRoot);
    CHECK(kind_of(Code::ROOT_FORBIDDEN) == BoundaryErrorKind::InvalidRoot);
    CHECK(kind_of(Code::PATH_OUTSIDE_ROOT) == BoundaryErrorKind::BoundaryViolation);
    CHECK(kind_of(Code::SYMLINK_ATTACK) == BoundaryErrorKind::BoundaryViolation);
    CHECK(kind_of(Code::SYMLINK_OUTSIDE_ROOT) == BoundaryErrorKind::Inaccessible);
    CHECK(kind_of(Code::PERMISSION_DENIED) == BoundaryErrorKind::Inaccessible);
    CHECK(kind_of(Code::PATH_NOT_FOUND) == BoundaryErrorKind::Inaccessible);
    CHECK(to_string(BoundaryErrorKind::BoundaryViolation) == "BoundaryViolation");
}

TEST_CASE("catalog provides message, resolution and name") {
    const auto info = ErrorCatalog::get_error_info(Code::ROOT_FORBIDDEN, "/etc");
    CHECK(info.code == Code::ROOT_FORBIDDEN);
    CHECK(info.message == "Cannot analyze system directory.");
    CHECK_FALSE(info.resolution.empty());
    CHECK(info.context == "/etc");
    CHECK(ErrorCatalog::code_name(Code::SYMLINK_ATTACK) == "SYMLINK_ATTACK");

    const std::string details = info.get_full_details();
    CHECK(details.find("Error 1202 (ROOT_FORBIDDEN)") == 0);
    CHECK(details.find("Details: /etc") != std::string::npos);
}

TEST_CASE("AppException keeps technical context out of what()") {
    const AppException ex(Code::PATH_OUTSIDE_ROOT, "/tmp/project/../../etc/passwd");

    CHECK(ex.get_error_code() == Code::PATH_OUTSIDE_ROOT);
    CHECK(ex.get_error_code_int() == 1210);
    CHECK(std::string(ex.what()).find("Path traversal detected") == 0);
    CHECK(std::string(ex.what()).find("/etc/passwd") == std::string::npos);
    CHECK(ex.get_full_details().find("/etc/passwd") != std::string::npos);
    CHECK(ex.kind() == BoundaryErrorKind::BoundaryViolation);
}

TEST_CASE("AppException with a custom message keeps the catalog resolution") {
    const AppException ex(Code::CONFIG_LOAD_FAILED, "Cannot write the configuration", "/nonexistent/config.ini");

    CHECK(std::string(ex.what()).find("Cannot write the configuration") == 0);
    CHECK(ex.get_context() == "/nonexistent/config.ini");
    CHECK(ex.get_error_info().resolution ==
          ErrorCatalog::get_error_info(Code::CONFIG_LOAD_FAILED).resolution);
    CHECK(ex.get_full_details().find("/nonexistent/config.ini") != std::string::npos);
}
