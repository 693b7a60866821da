#ifndef SENSITIVE_CONTENT_CLASSIFIER_HPP
#define SENSITIVE_CONTENT_CLASSIFIER_HPP

#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

struct SensitivityRules {
    std::vector<std::string> extra_patterns;     ///< Case-insensitive ECMAScript regexes.
    std::vector<std::string> extra_directories;  ///< Matched against every path segment.
    std::vector<std::string> extra_extensions;   ///< With or without the leading dot.
};

/**
 * @brief Decides from a path alone whether it likely holds secrets.
 *
 * Never opens or reads the file. Rules are checked in a fixed order and
 * the first match supplies the reason:
 *   1. any path segment is a sensitive directory name,
 *   2. the file name matches the ordered pattern table,
 *   3. the extension is a sensitive extension.
 * Callers should pass paths relative to the project root so that the
 * directories above the project do not take part in rule 1.
 */
class SensitiveContentClassifier {
public:
    SensitiveContentClassifier();
    // Throws ErrorCodes::AppException(CONFIG_INVALID_PATTERN) on a bad regex.
    explicit SensitiveContentClassifier(const SensitivityRules& rules);

    SensitivityVerdict classify(const std::filesystem::path& path) const;
    bool is_sensitive(const std::filesystem::path& path) const;
    std::optional<std::string> sensitivity_reason(const std::filesystem::path& path) const;
    std::pair<bool, std::optional<std::string>> should_skip_content(const std::filesystem::path& path) const;

    /**
     * @brief Lists sensitive entries under @p root, top level only unless
     * @p recursive. Reported paths are absolute; classification uses the
     * path relative to @p root. Unreadable subdirectories are skipped.
     */
    std::vector<SensitiveMatch> scan_directory(const std::filesystem::path& root,
                                               bool recursive = true) const;

    // Keeps the non-sensitive paths, preserving order. No filesystem access.
    std::vector<std::filesystem::path> filter_safe(const std::vector<std::filesystem::path>& paths) const;

    std::string create_skip_report(const std::vector<std::filesystem::path>& skipped) const;

    std::size_t pattern_count() const { return patterns_.size(); }
    std::size_t directory_count() const { return sensitive_dirs_.size(); }

private:
    struct Pattern {
        std::string source;
        std::regex expression;
        std::string description;
        bool matches_full_path{false};
    };

    void add_pattern(const std::string& source, const std::string& description);

    std::vector<Pattern> patterns_;
    std::vector<std::string> sensitive_dirs_;
    std::vector<std::string> sensitive_extensions_;
};

#endif
