#include "BoundedTreeWalker.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <system_error>

void BoundedTreeWalker::iterator::advance()
{
    if (!walker_) {
        return;
    }
    current_ = walker_->next();
    if (!current_) {
        walker_ = nullptr;
    }
}

BoundedTreeWalker::BoundedTreeWalker(const PathBoundaryValidator& validator,
                                     const std::filesystem::path& start,
                                     std::optional<std::size_t> max_depth)
    : validator_(validator),
      max_depth_(max_depth)
{
    const std::filesystem::path validated = validator_.validate(start, true);
    std::error_code ec;
    if (!std::filesystem::is_directory(validated, ec)) {
        THROW_APP_ERROR(ErrorCodes::Code::NOT_A_DIRECTORY,
                        "Cannot walk a non-directory: " + Utils::path_to_utf8(start));
    }
    pending_.push_back(PendingDirectory{validated, 0});
}

bool BoundedTreeWalker::may_descend_from(std::size_t depth) const
{
    return !max_depth_.has_value() || depth < *max_depth_;
}

std::optional<WalkEntry> BoundedTreeWalker::next()
{
    while (!pending_.empty()) {
        PendingDirectory current = std::move(pending_.back());
        pending_.pop_back();

        // A directory reachable through an in-root symlink is walked once
        if (!visited_.insert(Utils::path_to_utf8(current.path)).second) {
            continue;
        }

        DirectoryListing listing = validator_.read_directory(current.path);
        inaccessible_.insert(inaccessible_.end(), listing.skipped.begin(), listing.skipped.end());
        if (listing.failure) {
            if (auto logger = Logger::get_logger("core_logger")) {
                logger->warn("Skipping inaccessible path {}: {}",
                             Utils::path_to_utf8(current.path), listing.failure->detail);
            }
            inaccessible_.push_back(*listing.failure);
            continue;
        }

        WalkEntry entry;
        entry.directory = current.path;
        std::vector<std::filesystem::path> children;
        for (auto& child : listing.entries) {
            switch (child.type) {
                case EntryType::Directory:
                    entry.subdirectories.push_back(child.name);
                    children.push_back(std::move(child.path));
                    break;
                case EntryType::File:
                    entry.files.push_back(child.name);
                    break;
                default:
                    break;
            }
        }

        if (may_descend_from(current.depth)) {
            // Reverse push keeps siblings in name order when popped
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                pending_.push_back(PendingDirectory{std::move(*it), current.depth + 1});
            }
        }
        return entry;
    }
    return std::nullopt;
}
