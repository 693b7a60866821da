#ifndef BOUNDED_TREE_WALKER_HPP
#define BOUNDED_TREE_WALKER_HPP

#include "PathBoundaryValidator.hpp"
#include "Types.hpp"

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Lazy, depth-bounded, depth-first walk over a project tree.
 *
 * Produces one WalkEntry per readable directory, parents before children
 * and siblings in name order. Directories are listed only when next() is
 * called, so a consumer that stops early triggers no further filesystem
 * access. Unreadable subtrees and unsafe entries are skipped and counted.
 * A walker is single-use and must not be advanced from several threads.
 */
class BoundedTreeWalker {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = WalkEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = const WalkEntry*;
        using reference = const WalkEntry&;

        iterator() = default;
        explicit iterator(BoundedTreeWalker* walker) : walker_(walker) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance(); return *this; }
        bool operator==(const iterator& other) const { return walker_ == other.walker_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        void advance();

        BoundedTreeWalker* walker_{nullptr};
        std::optional<WalkEntry> current_;
    };

    // Throws ErrorCodes::AppException if start is not a directory inside the root.
    BoundedTreeWalker(const PathBoundaryValidator& validator,
                      const std::filesystem::path& start,
                      std::optional<std::size_t> max_depth = std::nullopt);

    std::optional<WalkEntry> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    std::size_t inaccessible_count() const { return inaccessible_.size(); }
    const std::vector<BoundaryFailure>& inaccessible() const { return inaccessible_; }

private:
    struct PendingDirectory {
        std::filesystem::path path;
        std::size_t depth{0};
    };

    bool may_descend_from(std::size_t depth) const;

    const PathBoundaryValidator& validator_;
    std::optional<std::size_t> max_depth_;
    std::vector<PendingDirectory> pending_;
    std::unordered_set<std::string> visited_;
    std::vector<BoundaryFailure> inaccessible_;
};

#endif
