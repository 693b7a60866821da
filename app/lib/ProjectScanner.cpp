#include "ProjectScanner.hpp"
#include "AppException.hpp"
#include "BoundedTreeWalker.hpp"
#include "Logger.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace {

bool is_line_counted(const std::string& extension)
{
    static const std::unordered_set<std::string> text_extensions = {
        ".py", ".js", ".ts", ".jsx", ".tsx", ".java", ".go", ".rs", ".rb", ".php",
        ".c", ".cpp", ".h", ".md", ".txt", ".yml", ".yaml", ".json", ".xml"
    };
    return text_extensions.contains(extension);
}

std::string current_timestamp()
{
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

} // namespace


ScanOptions ScanOptions::from_settings(const Settings& settings)
{
    ScanOptions options;
    options.max_depth = settings.get_max_depth();
    options.max_files = settings.get_max_files();
    if (auto roots = settings.get_forbidden_roots()) {
        options.forbidden_roots = std::move(*roots);
    }
    options.sensitivity = settings.get_sensitivity_rules();
    return options;
}


ProjectScanner::ProjectScanner(const fs::path& project_root, ScanOptions options)
    : options_(std::move(options)),
      validator_(project_root, options_.forbidden_roots),
      classifier_(options_.sensitivity)
{
}

ScanReport ProjectScanner::scan() const
{
    auto logger = Logger::get_logger("core_logger");
    const fs::path& root = validator_.project_root();

    ScanReport report;
    report.project_path = Utils::path_to_utf8(root);
    report.timestamp = current_timestamp();

    if (logger) {
        logger->info("Starting project scan of {}", report.project_path);
    }

    BoundedTreeWalker walker = validator_.safe_walk(root, options_.max_depth);
    ProjectStats& stats = report.stats;
    std::size_t blocked = 0;

    while (!report.truncated) {
        std::optional<WalkEntry> entry = walker.next();
        if (!entry) {
            break;
        }
        for (const auto& name : entry->files) {
            if (options_.max_files && stats.files_analyzed >= *options_.max_files) {
                if (logger) {
                    logger->info("Reached max_files limit: {}", *options_.max_files);
                }
                report.truncated = true;
                break;
            }

            const fs::path file_path = entry->directory / Utils::utf8_to_path(name);
            const fs::path relative = file_path.lexically_relative(root);
            ++stats.total_files;

            const SensitivityVerdict verdict = classifier_.classify(relative);
            if (verdict.is_sensitive) {
                if (logger) {
                    logger->debug("Skipping sensitive file {} ({})", Utils::generic_utf8(relative),
                                  verdict.reason.value_or(""));
                }
                report.sensitive_files_skipped.push_back(Utils::generic_utf8(relative));
                continue;
            }

            // The entry may have been swapped for a link since it was listed
            fs::path checked;
            try {
                checked = validator_.validate(file_path, true, true);
            } catch (const ErrorCodes::AppException& ex) {
                if (logger) {
                    logger->warn("Not reading {} ({}): {}", Utils::path_to_utf8(file_path),
                                 to_string(ex.kind()), ex.get_context());
                }
                report.warnings.push_back("Blocked: " + name);
                ++blocked;
                continue;
            }

            // A harmless link name can still point at a sensitive file
            const fs::path target = checked.lexically_relative(root);
            if (target != relative) {
                const SensitivityVerdict target_verdict = classifier_.classify(target);
                if (target_verdict.is_sensitive) {
                    if (logger) {
                        logger->debug("Skipping link {} to sensitive file {} ({})",
                                      Utils::generic_utf8(relative), Utils::generic_utf8(target),
                                      target_verdict.reason.value_or(""));
                    }
                    report.sensitive_files_skipped.push_back(Utils::generic_utf8(relative));
                    continue;
                }
            }

            ++stats.files_analyzed;
            collect_file_stats(checked, report);
        }
    }

    report.inaccessible_paths = walker.inaccessible_count() + blocked;
    stats.has_tests = has_test_directory();
    std::error_code ec;
    stats.is_git_repo = fs::exists(root / ".git", ec);

    if (logger) {
        logger->info("Scan complete: {} files analyzed, {} sensitive files skipped, {} paths inaccessible",
                     stats.files_analyzed, report.sensitive_files_skipped.size(), report.inaccessible_paths);
    }
    return report;
}

void ProjectScanner::collect_file_stats(const fs::path& file_path, ScanReport& report) const
{
    ProjectStats& stats = report.stats;
    const std::string name = Utils::path_to_utf8(file_path.filename());

    std::error_code ec;
    const auto size = fs::file_size(file_path, ec);
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("Error reading {}: {}", Utils::path_to_utf8(file_path), ec.message());
        }
        report.warnings.push_back("Could not read: " + name);
        return;
    }
    stats.total_size_bytes += size;

    std::string extension = Utils::to_lower_copy(Utils::path_to_utf8(file_path.extension()));
    if (extension.empty()) {
        extension = ".no_extension";
    }
    ++stats.files_by_extension[extension];

    if (!is_line_counted(extension)) {
        return;
    }
    std::ifstream input(file_path, std::ios::binary);
    if (!input.is_open()) {
        report.warnings.push_back("Could not read: " + name);
        return;
    }
    std::string line;
    while (std::getline(input, line)) {
        ++stats.total_lines;
    }
}

bool ProjectScanner::has_test_directory() const
{
    const fs::path& root = validator_.project_root();
    for (const char* candidate : {"tests", "test", "__tests__"}) {
        std::error_code ec;
        if (fs::exists(root / candidate, ec)) {
            return true;
        }
    }
    return false;
}
