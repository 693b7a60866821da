#include "PathBoundaryValidator.hpp"
#include "AppException.hpp"
#include "BoundedTreeWalker.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <system_error>

using ErrorCodes::Code;

namespace {

constexpr int kMaxSymlinkHops = 40;

// Component-wise ancestor test; a trailing separator on either side is ignored.
bool is_ancestor_or_self(const fs::path& ancestor, const fs::path& path)
{
    auto path_it = path.begin();
    for (const auto& part : ancestor) {
        if (part.empty()) {
            continue;
        }
        if (path_it == path.end() || *path_it != part) {
            return false;
        }
        ++path_it;
    }
    return true;
}

Code code_for(const std::error_code& ec)
{
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return Code::PERMISSION_DENIED;
    }
    if (ec == std::errc::no_such_file_or_directory) {
        return Code::PATH_NOT_FOUND;
    }
    if (ec == std::errc::not_a_directory) {
        return Code::NOT_A_DIRECTORY;
    }
    if (ec == std::errc::too_many_symbolic_link_levels) {
        return Code::SYMLINK_UNRESOLVABLE;
    }
    return Code::FILESYSTEM_ERROR;
}

EntryType entry_type_of(const fs::path& path)
{
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec) {
        return EntryType::Other;
    }
    if (fs::is_directory(status)) {
        return EntryType::Directory;
    }
    if (fs::is_regular_file(status)) {
        return EntryType::File;
    }
    return EntryType::Other;
}

// Follows a link chain to its last hop, including a target that does not exist.
std::optional<fs::path> resolve_link_chain(const fs::path& link, std::error_code& ec)
{
    fs::path current = link;
    for (int hop = 0; hop < kMaxSymlinkHops; ++hop) {
        fs::path resolved = fs::weakly_canonical(current, ec);
        if (ec) {
            return std::nullopt;
        }
        const auto status = fs::symlink_status(resolved, ec);
        if (ec) {
            if (status.type() == fs::file_type::not_found) {
                ec.clear();
                return resolved;
            }
            return std::nullopt;
        }
        if (!fs::is_symlink(status)) {
            return resolved;
        }
        // weakly_canonical stops at a dangling link; step through it by hand
        fs::path next = fs::read_symlink(resolved, ec);
        if (ec) {
            return std::nullopt;
        }
        current = next.is_absolute() ? next : resolved.parent_path() / next;
    }
    ec = std::make_error_code(std::errc::too_many_symbolic_link_levels);
    return std::nullopt;
}

} // namespace


std::vector<std::string> default_forbidden_roots()
{
    return {
        "/etc",
        "/sys",
        "/proc",
        "/root",
        "/boot",
        "/dev",
        "/run",
        "/var/run",
        "/tmp/systemd-private*",
        "C:\\Windows",
        "C:\\Windows\\System32",
        "C:\\Program Files",
    };
}

bool is_under_forbidden_root(const fs::path& canonical_path,
                             const std::vector<std::string>& forbidden_roots)
{
    for (const auto& entry : forbidden_roots) {
        if (entry.empty()) {
            continue;
        }
        if (entry.back() != '*') {
            if (is_ancestor_or_self(Utils::utf8_to_path(entry), canonical_path)) {
                return true;
            }
            continue;
        }

        const fs::path pattern = Utils::utf8_to_path(entry.substr(0, entry.size() - 1));
        const fs::path parent = pattern.parent_path();
        const std::string name_prefix = Utils::path_to_utf8(pattern.filename());
        if (parent.empty() || !is_ancestor_or_self(parent, canonical_path)) {
            continue;
        }
        const fs::path relative = canonical_path.lexically_relative(parent);
        if (relative.empty() || relative == ".") {
            continue;
        }
        if (Utils::path_to_utf8(*relative.begin()).starts_with(name_prefix)) {
            return true;
        }
    }
    return false;
}

fs::path validate_project_root(const fs::path& project_root,
                               const std::vector<std::string>& forbidden_roots)
{
    const std::string display = Utils::path_to_utf8(project_root);
    std::error_code ec;
    const fs::path absolute = fs::absolute(project_root, ec);
    if (ec || !fs::exists(absolute, ec)) {
        THROW_APP_ERROR(Code::ROOT_NOT_FOUND, "Project root does not exist: " + display);
    }
    if (!fs::is_directory(absolute, ec)) {
        THROW_APP_ERROR(Code::ROOT_NOT_DIRECTORY, "Project root is not a directory: " + display);
    }

    const fs::path canonical = fs::canonical(absolute, ec);
    if (ec) {
        THROW_APP_ERROR(Code::ROOT_NOT_FOUND,
                        "Cannot resolve project root " + display + ": " + ec.message());
    }

    if (is_under_forbidden_root(canonical, forbidden_roots)) {
        THROW_APP_ERROR(Code::ROOT_FORBIDDEN,
                        "Cannot analyze system directory: " + Utils::path_to_utf8(canonical) +
                        " (forbidden roots: " + Utils::join_list(forbidden_roots, ", ") + ")");
    }
    return canonical;
}


PathBoundaryValidator::PathBoundaryValidator(const fs::path& project_root)
    : PathBoundaryValidator(project_root, default_forbidden_roots())
{
}

PathBoundaryValidator::PathBoundaryValidator(const fs::path& project_root,
                                             std::vector<std::string> forbidden_roots)
    : root_(validate_project_root(project_root, forbidden_roots)),
      forbidden_roots_(std::move(forbidden_roots))
{
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("PathBoundaryValidator initialized for: {}", Utils::path_to_utf8(root_));
    }
}

fs::path PathBoundaryValidator::absolute_candidate(const fs::path& candidate) const
{
    if (candidate.is_absolute()) {
        return candidate;
    }
    return root_ / candidate;
}

PathResolution PathBoundaryValidator::resolve(const fs::path& candidate,
                                              bool must_exist,
                                              bool follow_symlinks) const
{
    const fs::path absolute = absolute_candidate(candidate);

    // The symlink check must happen before anything resolves the link away
    std::error_code ec;
    if (fs::is_symlink(fs::symlink_status(absolute, ec))) {
        return resolve_symlink(absolute, must_exist, follow_symlinks);
    }

    const fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return PathResolution::failure(code_for(ec), absolute,
                                       "Cannot resolve " + Utils::path_to_utf8(absolute) +
                                       ": " + ec.message());
    }

    if (!is_within_root(resolved)) {
        return PathResolution::failure(
            Code::PATH_OUTSIDE_ROOT, absolute,
            "Path traversal detected: '" + Utils::path_to_utf8(candidate) + "' resolves to '" +
            Utils::path_to_utf8(resolved) + "' which is outside project root '" +
            Utils::path_to_utf8(root_) + "'");
    }

    return check_exists(resolved, absolute, must_exist);
}

PathResolution PathBoundaryValidator::resolve_symlink(const fs::path& link,
                                                      bool must_exist,
                                                      bool follow_symlinks) const
{
    const std::string link_text = Utils::path_to_utf8(link);
    std::error_code ec;
    const auto target = resolve_link_chain(link, ec);
    if (!target) {
        return PathResolution::failure(Code::SYMLINK_UNRESOLVABLE, link,
                                       "Cannot resolve symlink " + link_text + ": " + ec.message());
    }

    const std::string target_text = Utils::path_to_utf8(*target);
    if (!is_within_root(*target)) {
        if (follow_symlinks) {
            return PathResolution::failure(
                Code::SYMLINK_ATTACK, link,
                "Symlink attack detected: " + link_text + " -> " + target_text +
                " (target is outside project root " + Utils::path_to_utf8(root_) + ")");
        }
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Skipping symlink pointing outside project: {} -> {}", link_text, target_text);
        }
        return PathResolution::failure(Code::SYMLINK_OUTSIDE_ROOT, link,
                                       "Symlink points outside project: " + link_text);
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->debug("Following safe symlink: {} -> {}", link_text, target_text);
    }
    return check_exists(*target, link, must_exist);
}

PathResolution PathBoundaryValidator::check_exists(const fs::path& resolved,
                                                   const fs::path& candidate,
                                                   bool must_exist) const
{
    if (!must_exist) {
        return PathResolution::success(resolved);
    }
    std::error_code ec;
    const bool exists = fs::exists(resolved, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return PathResolution::failure(code_for(ec), candidate,
                                       "Cannot stat " + Utils::path_to_utf8(resolved) +
                                       ": " + ec.message());
    }
    if (!exists) {
        return PathResolution::failure(Code::PATH_NOT_FOUND, candidate,
                                       "Path does not exist: " + Utils::path_to_utf8(candidate));
    }
    return PathResolution::success(resolved);
}

fs::path PathBoundaryValidator::validate(const fs::path& candidate,
                                         bool must_exist,
                                         bool follow_symlinks) const
{
    PathResolution resolution = resolve(candidate, must_exist, follow_symlinks);
    if (resolution) {
        return resolution.path();
    }

    const BoundaryFailure& failure = resolution.error();
    if (failure.kind() == BoundaryErrorKind::BoundaryViolation) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Blocked access outside project root: {}", failure.detail);
        }
    }
    THROW_APP_ERROR(failure.code, failure.detail);
}

bool PathBoundaryValidator::is_within_root(const fs::path& path) const
{
    if (!path.is_absolute()) {
        return false;
    }
    return is_ancestor_or_self(root_, path.lexically_normal());
}

std::vector<ValidatedEntry> PathBoundaryValidator::safe_iterdir(const fs::path& directory) const
{
    const fs::path validated = validate(directory, true);

    std::error_code ec;
    if (!fs::is_directory(validated, ec)) {
        THROW_APP_ERROR(Code::NOT_A_DIRECTORY, "Not a directory: " + Utils::path_to_utf8(directory));
    }

    DirectoryListing listing = read_directory(validated);
    return std::move(listing.entries);
}

DirectoryListing PathBoundaryValidator::read_directory(const fs::path& canonical_directory) const
{
    DirectoryListing listing;
    auto logger = Logger::get_logger("core_logger");
    const std::string dir_text = Utils::path_to_utf8(canonical_directory);

    std::error_code ec;
    fs::directory_iterator it(canonical_directory, ec);
    if (ec) {
        listing.failure = BoundaryFailure{code_for(ec), canonical_directory, ec.message()};
        if (logger) {
            if (listing.failure->code == Code::PERMISSION_DENIED) {
                logger->warn("Permission denied reading directory: {} - {}", dir_text, ec.message());
            } else {
                logger->warn("Cannot read directory: {} - {}", dir_text, ec.message());
            }
        }
        return listing;
    }

    while (it != fs::directory_iterator()) {
        const fs::path child = it->path();
        std::error_code link_ec;
        const bool via_symlink = it->is_symlink(link_ec);

        PathResolution resolution = resolve(child, false, false);
        if (resolution) {
            listing.entries.push_back(ValidatedEntry{
                Utils::path_to_utf8(child.filename()),
                resolution.path(),
                entry_type_of(resolution.path()),
                via_symlink});
        } else {
            if (logger) {
                logger->warn("Skipping unsafe path: {} - {}", Utils::path_to_utf8(child),
                             resolution.error().detail);
            }
            listing.skipped.push_back(resolution.error());
        }

        it.increment(ec);
        if (ec) {
            listing.failure = BoundaryFailure{code_for(ec), canonical_directory, ec.message()};
            if (logger) {
                logger->warn("Error walking directory {}: {}", dir_text, ec.message());
            }
            break;
        }
    }

    std::sort(listing.entries.begin(), listing.entries.end(),
              [](const ValidatedEntry& lhs, const ValidatedEntry& rhs) { return lhs.name < rhs.name; });
    return listing;
}

BoundedTreeWalker PathBoundaryValidator::safe_walk(const fs::path& start,
                                                   std::optional<std::size_t> max_depth) const
{
    return BoundedTreeWalker(*this, start, max_depth);
}
