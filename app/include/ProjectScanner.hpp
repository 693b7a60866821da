#ifndef PROJECT_SCANNER_HPP
#define PROJECT_SCANNER_HPP

#include "PathBoundaryValidator.hpp"
#include "SensitiveContentClassifier.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

class Settings;

struct ScanOptions {
    std::optional<std::size_t> max_depth;
    std::optional<std::size_t> max_files;
    std::vector<std::string> forbidden_roots = default_forbidden_roots();
    SensitivityRules sensitivity;

    static ScanOptions from_settings(const Settings& settings);
};

struct ProjectStats {
    std::size_t total_files{0};     ///< Every file seen, sensitive ones included.
    std::size_t files_analyzed{0};  ///< Non-sensitive files whose metadata was read.
    std::uintmax_t total_size_bytes{0};
    std::size_t total_lines{0};
    std::map<std::string, std::size_t> files_by_extension;
    bool has_tests{false};
    bool is_git_repo{false};
};

struct ScanReport {
    std::string project_path;
    std::string timestamp;
    ProjectStats stats;
    std::vector<std::string> sensitive_files_skipped;  ///< Relative, forward slashes.
    std::vector<std::string> warnings;
    std::size_t inaccessible_paths{0};
    bool truncated{false};  ///< The max_files limit stopped the walk.
};

/**
 * @brief Builds project statistics from a bounded walk, routing every file
 * through the classifier before anything reads it.
 *
 * Owns the validator and the classifier for one scan session and lends
 * them to the walk by reference.
 */
class ProjectScanner {
public:
    // Throws ErrorCodes::AppException for an invalid root or an invalid custom pattern.
    ProjectScanner(const std::filesystem::path& project_root, ScanOptions options);

    ScanReport scan() const;

    const PathBoundaryValidator& validator() const { return validator_; }
    const SensitiveContentClassifier& classifier() const { return classifier_; }

private:
    void collect_file_stats(const std::filesystem::path& file_path, ScanReport& report) const;
    bool has_test_directory() const;

    ScanOptions options_;
    PathBoundaryValidator validator_;
    SensitiveContentClassifier classifier_;
};

#endif
