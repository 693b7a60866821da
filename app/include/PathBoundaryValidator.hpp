#ifndef PATH_BOUNDARY_VALIDATOR_HPP
#define PATH_BOUNDARY_VALIDATOR_HPP

#include "Types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class BoundedTreeWalker;

/**
 * @brief Children of one directory that passed validation, plus the
 * entries that were dropped and why.
 */
struct DirectoryListing {
    std::vector<ValidatedEntry> entries;
    std::vector<BoundaryFailure> skipped;
    // Set when the directory itself could not be read
    std::optional<BoundaryFailure> failure;
};

/**
 * @brief System directories that may never be used as a project root.
 *
 * Entries are compared as path ancestors, so "/etc" covers "/etc/ssl" but
 * not "/etcetera". An entry ending in '*' matches any sibling whose name
 * starts with the text before the '*' ("/tmp/systemd-private*").
 */
std::vector<std::string> default_forbidden_roots();

bool is_under_forbidden_root(const fs::path& canonical_path,
                             const std::vector<std::string>& forbidden_roots);

/**
 * @brief Canonicalize a project root and check it is an existing,
 * non-forbidden directory.
 * @throws ErrorCodes::AppException with ROOT_NOT_FOUND, ROOT_NOT_DIRECTORY
 * or ROOT_FORBIDDEN.
 */
fs::path validate_project_root(const fs::path& project_root,
                               const std::vector<std::string>& forbidden_roots = default_forbidden_roots());

/**
 * @brief Confines every filesystem access of a scan to one project root.
 *
 * Immutable after construction; all const members may be called from
 * several threads at once.
 */
class PathBoundaryValidator {
public:
    explicit PathBoundaryValidator(const fs::path& project_root);
    PathBoundaryValidator(const fs::path& project_root, std::vector<std::string> forbidden_roots);

    const fs::path& project_root() const { return root_; }
    const std::vector<std::string>& forbidden_roots() const { return forbidden_roots_; }

    /**
     * @brief Soft validation: never throws, reports failures in the result.
     *
     * Relative candidates are taken relative to the project root. A
     * candidate that is itself a symlink is resolved through its whole link
     * chain; a target outside the root yields SYMLINK_ATTACK when
     * @p follow_symlinks is set and SYMLINK_OUTSIDE_ROOT otherwise.
     */
    PathResolution resolve(const fs::path& candidate,
                           bool must_exist = true,
                           bool follow_symlinks = false) const;

    /**
     * @brief Strict validation for a path the caller is about to dereference.
     * @return Canonical path inside the project root.
     * @throws ErrorCodes::AppException carrying the failure code.
     */
    fs::path validate(const fs::path& candidate,
                      bool must_exist = true,
                      bool follow_symlinks = false) const;

    // Pure containment test; expects a canonical absolute path.
    bool is_within_root(const fs::path& path) const;

    /**
     * @brief Validated children of @p directory, sorted by name.
     *
     * The directory itself is validated strictly. Children failing
     * validation are logged and omitted; an unreadable directory yields an
     * empty list and a warning.
     */
    std::vector<ValidatedEntry> safe_iterdir(const fs::path& directory) const;

    // Lists a directory already known to be canonical and inside the root.
    DirectoryListing read_directory(const fs::path& canonical_directory) const;

    /**
     * @brief Lazy depth-first walk from @p start. Depth 0 is @p start itself.
     * @throws ErrorCodes::AppException if @p start fails strict validation.
     */
    BoundedTreeWalker safe_walk(const fs::path& start,
                                std::optional<std::size_t> max_depth = std::nullopt) const;

private:
    fs::path absolute_candidate(const fs::path& candidate) const;
    PathResolution resolve_symlink(const fs::path& link,
                                   bool must_exist,
                                   bool follow_symlinks) const;
    PathResolution check_exists(const fs::path& resolved,
                                const fs::path& candidate,
                                bool must_exist) const;

    fs::path root_;
    std::vector<std::string> forbidden_roots_;
};

#endif
