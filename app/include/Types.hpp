#ifndef TYPES_HPP
#define TYPES_HPP

#include "ErrorCode.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class BoundaryErrorKind {
    InvalidRoot,       ///< Bad or forbidden project root; fatal at construction.
    BoundaryViolation, ///< Resolved path lies outside the root; fatal for the call.
    Inaccessible       ///< Skip-worthy: missing, unreadable, or outward symlink in soft mode.
};

inline BoundaryErrorKind kind_of(ErrorCodes::Code code) {
    using ErrorCodes::Code;
    switch (code) {
        case Code::ROOT_NOT_FOUND:
        case Code::ROOT_NOT_DIRECTORY:
        case Code::ROOT_FORBIDDEN:
            return BoundaryErrorKind::InvalidRoot;
        case Code::PATH_OUTSIDE_ROOT:
        case Code::SYMLINK_ATTACK:
            return BoundaryErrorKind::BoundaryViolation;
        default:
            return BoundaryErrorKind::Inaccessible;
    }
}

inline std::string to_string(BoundaryErrorKind kind) {
    switch (kind) {
        case BoundaryErrorKind::InvalidRoot: return "InvalidRoot";
        case BoundaryErrorKind::BoundaryViolation: return "BoundaryViolation";
        case BoundaryErrorKind::Inaccessible: return "Inaccessible";
        default: return "Unknown";
    }
}

struct BoundaryFailure {
    ErrorCodes::Code code{ErrorCodes::Code::UNKNOWN_ERROR};
    std::filesystem::path path;
    std::string detail;

    BoundaryErrorKind kind() const { return kind_of(code); }
};

/**
 * @brief Outcome of validating one candidate path: a canonical path inside
 * the project root, or a typed failure.
 */
class PathResolution {
public:
    static PathResolution success(std::filesystem::path canonical) {
        PathResolution result;
        result.path_ = std::move(canonical);
        return result;
    }

    static PathResolution failure(ErrorCodes::Code code,
                                  std::filesystem::path path,
                                  std::string detail) {
        PathResolution result;
        result.failure_ = BoundaryFailure{code, std::move(path), std::move(detail)};
        return result;
    }

    bool ok() const { return path_.has_value(); }
    explicit operator bool() const { return ok(); }

    // Only meaningful when ok()
    const std::filesystem::path& path() const { return *path_; }
    // Only meaningful when !ok()
    const BoundaryFailure& error() const { return *failure_; }

private:
    PathResolution() = default;

    std::optional<std::filesystem::path> path_;
    std::optional<BoundaryFailure> failure_;
};

enum class EntryType {File, Directory, Other};

inline std::string to_string(EntryType type) {
    switch (type) {
        case EntryType::File: return "file";
        case EntryType::Directory: return "directory";
        default: return "other";
    }
}

// One child of a directory that passed validation.
struct ValidatedEntry {
    std::string name;               ///< Name as listed in the parent directory.
    std::filesystem::path path;     ///< Canonical path; always inside the root.
    EntryType type{EntryType::Other};
    bool via_symlink{false};
};

struct WalkEntry {
    std::filesystem::path directory;
    std::vector<std::string> subdirectories;
    std::vector<std::string> files;
};

enum class SensitivityCategory {None, Directory, FilenamePattern, Extension};

inline std::string to_string(SensitivityCategory category) {
    switch (category) {
        case SensitivityCategory::Directory: return "directory";
        case SensitivityCategory::FilenamePattern: return "filename-pattern";
        case SensitivityCategory::Extension: return "extension";
        default: return "none";
    }
}

struct SensitivityVerdict {
    bool is_sensitive{false};
    std::optional<std::string> reason;
    SensitivityCategory category{SensitivityCategory::None};
};

struct SensitiveMatch {
    std::string path;
    std::string reason;
    EntryType type{EntryType::File};
    SensitivityCategory category{SensitivityCategory::None};
};

#endif
