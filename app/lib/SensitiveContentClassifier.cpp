#include "SensitiveContentClassifier.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

struct PatternSpec {
    const char* source;
    const char* description;
};

// Order matters: the first matching entry supplies the reason.
const std::vector<PatternSpec>& builtin_patterns()
{
    static const std::vector<PatternSpec> patterns = {
        // Environment files
        {R"(\.env$)", "Environment variables"},
        {R"(\.env\..*)", "Environment variables (specific environment)"},
        {R"(env\..*)", "Environment variables"},

        // Credentials and secrets
        {R"(credentials\.json$)", "GCP/AWS credentials"},
        {R"(credentials\.ya?ml$)", "Credentials file"},
        {R"(service-account.*\.json$)", "Service account credentials"},
        {R"(secrets\.json$)", "Secrets file"},
        {R"(secrets\.ya?ml$)", "Secrets file"},
        {R"(\.secrets$)", "Secrets file"},

        // Private keys and certificates
        {R"(.*\.pem$)", "PEM certificate/key"},
        {R"(.*\.key$)", "Private key"},
        {R"(.*\.p12$)", "PKCS12 certificate"},
        {R"(.*\.pfx$)", "PFX certificate"},
        {R"(id_rsa$)", "SSH private key"},
        {R"(id_dsa$)", "SSH private key"},
        {R"(id_ecdsa$)", "SSH private key"},
        {R"(id_ed25519$)", "SSH private key"},
        {R"(.*_rsa$)", "RSA private key"},
        {R"(.*_dsa$)", "DSA private key"},

        // API keys and tokens
        {R"(\.?api[-_]?keys?\..*)", "API keys"},
        {R"(\.?auth[-_]?tokens?\..*)", "Authentication tokens"},
        {R"(\.npmrc$)", "NPM credentials"},
        {R"(\.pypirc$)", "PyPI credentials"},

        // Cloud provider configs; matched against the whole path
        {R"(\.aws/credentials$)", "AWS credentials"},
        {R"(\.aws/config$)", "AWS config"},
        {R"(\.gcp/credentials$)", "GCP credentials"},
        {R"(\.azure/credentials$)", "Azure credentials"},

        // Database configs
        {R"(database\.ya?ml$)", "Database configuration"},
        {R"(db\.ya?ml$)", "Database configuration"},

        // Password files
        {R"(passwords?\.txt$)", "Password file"},
        {R"(passwd$)", "Password file"},
        {R"(shadow$)", "Shadow password file"},

        // Backups and dumps
        {R"(.*\.sql\.gz$)", "Database dump"},
        {R"(.*\.sql$)", "Database dump"},
        {R"(backup.*\.tar\.gz$)", "Backup archive"},

        // Private notes and documents
        {R"(private.*\.txt$)", "Private document"},
        {R"(confidential.*)", "Confidential document"},
    };
    return patterns;
}

const std::vector<std::string>& builtin_directories()
{
    static const std::vector<std::string> directories = {
        ".git", ".ssh", ".gnupg", ".aws", ".azure", ".gcp",
        "credentials", "secrets", "private", "confidential"
    };
    return directories;
}

const std::vector<std::string>& builtin_extensions()
{
    static const std::vector<std::string> extensions = {
        ".pem", ".key", ".p12", ".pfx", ".jks", ".keystore"
    };
    return extensions;
}

bool contains(const std::vector<std::string>& values, const std::string& value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

void append_unique(std::vector<std::string>& values, std::string value)
{
    if (!value.empty() && !contains(values, value)) {
        values.push_back(std::move(value));
    }
}

} // namespace


SensitiveContentClassifier::SensitiveContentClassifier()
    : SensitiveContentClassifier(SensitivityRules{})
{
}

SensitiveContentClassifier::SensitiveContentClassifier(const SensitivityRules& rules)
{
    for (const auto& spec : builtin_patterns()) {
        add_pattern(spec.source, spec.description);
    }
    for (const auto& source : rules.extra_patterns) {
        add_pattern(source, "Custom sensitive pattern");
    }

    for (const auto& name : builtin_directories()) {
        append_unique(sensitive_dirs_, name);
    }
    for (const auto& name : rules.extra_directories) {
        append_unique(sensitive_dirs_, Utils::to_lower_copy(Utils::trim_copy(name)));
    }

    for (const auto& ext : builtin_extensions()) {
        append_unique(sensitive_extensions_, ext);
    }
    for (const auto& ext : rules.extra_extensions) {
        std::string normalized = Utils::to_lower_copy(Utils::trim_copy(ext));
        if (!normalized.empty() && normalized.front() != '.') {
            normalized.insert(normalized.begin(), '.');
        }
        append_unique(sensitive_extensions_, std::move(normalized));
    }

    if (auto logger = Logger::get_logger("core_logger")) {
        logger->info("SensitiveContentClassifier initialized with {} patterns, {} sensitive directories",
                     patterns_.size(), sensitive_dirs_.size());
    }
}

void SensitiveContentClassifier::add_pattern(const std::string& source, const std::string& description)
{
    try {
        patterns_.push_back(Pattern{
            source,
            std::regex(source, std::regex::ECMAScript | std::regex::icase),
            description,
            source.find('/') != std::string::npos});
    } catch (const std::regex_error& ex) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_INVALID_PATTERN,
                        "Pattern '" + source + "': " + ex.what());
    }
}

SensitivityVerdict SensitiveContentClassifier::classify(const fs::path& path) const
{
    for (const auto& part : path) {
        const std::string segment = Utils::path_to_utf8(part);
        if (segment.empty() || part == path.root_directory()) {
            continue;
        }
        if (contains(sensitive_dirs_, Utils::to_lower_copy(segment))) {
            return SensitivityVerdict{true, "In sensitive directory: " + segment,
                                      SensitivityCategory::Directory};
        }
    }

    const std::string filename = Utils::to_lower_copy(Utils::path_to_utf8(path.filename()));
    const std::string full_path = Utils::to_lower_copy(Utils::generic_utf8(path));
    for (const auto& pattern : patterns_) {
        const std::string& subject = pattern.matches_full_path ? full_path : filename;
        if (std::regex_search(subject, pattern.expression)) {
            return SensitivityVerdict{true, pattern.description, SensitivityCategory::FilenamePattern};
        }
    }

    const std::string extension = Utils::path_to_utf8(path.extension());
    if (!extension.empty() && contains(sensitive_extensions_, Utils::to_lower_copy(extension))) {
        return SensitivityVerdict{true, "Sensitive file extension: " + extension,
                                  SensitivityCategory::Extension};
    }

    return SensitivityVerdict{};
}

bool SensitiveContentClassifier::is_sensitive(const fs::path& path) const
{
    return classify(path).is_sensitive;
}

std::optional<std::string> SensitiveContentClassifier::sensitivity_reason(const fs::path& path) const
{
    return classify(path).reason;
}

std::pair<bool, std::optional<std::string>>
SensitiveContentClassifier::should_skip_content(const fs::path& path) const
{
    SensitivityVerdict verdict = classify(path);
    return {verdict.is_sensitive, std::move(verdict.reason)};
}

std::vector<SensitiveMatch> SensitiveContentClassifier::scan_directory(const fs::path& root,
                                                                      bool recursive) const
{
    std::vector<SensitiveMatch> matches;
    auto logger = Logger::get_logger("core_logger");

    auto record = [&](const fs::directory_entry& entry) {
        const fs::path relative = entry.path().lexically_relative(root);
        SensitivityVerdict verdict = classify(relative);
        if (!verdict.is_sensitive) {
            return;
        }
        std::error_code type_ec;
        const EntryType type = entry.is_directory(type_ec) ? EntryType::Directory : EntryType::File;
        matches.push_back(SensitiveMatch{Utils::path_to_utf8(entry.path()),
                                         verdict.reason.value_or(""), type, verdict.category});
    };

    // Directories that cannot be listed are skipped; siblings are still audited
    std::vector<fs::path> pending{root};
    while (!pending.empty()) {
        const fs::path directory = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(directory, ec);
        if (ec) {
            if (logger) {
                logger->warn("Skipping unreadable directory {}: {}",
                             Utils::path_to_utf8(directory), ec.message());
            }
            continue;
        }

        std::vector<fs::path> subdirectories;
        while (it != fs::directory_iterator()) {
            record(*it);
            std::error_code type_ec;
            if (recursive && it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
                subdirectories.push_back(it->path());
            }
            it.increment(ec);
            if (ec) {
                if (logger) {
                    logger->warn("Error listing {}: {}", Utils::path_to_utf8(directory), ec.message());
                }
                break;
            }
        }
        std::sort(subdirectories.begin(), subdirectories.end());
        pending.insert(pending.end(), subdirectories.rbegin(), subdirectories.rend());
    }

    if (logger) {
        logger->info("Found {} sensitive items in {}", matches.size(), Utils::path_to_utf8(root));
    }
    return matches;
}

std::vector<fs::path> SensitiveContentClassifier::filter_safe(const std::vector<fs::path>& paths) const
{
    std::vector<fs::path> safe;
    safe.reserve(paths.size());
    std::size_t filtered = 0;
    auto logger = Logger::get_logger("core_logger");

    for (const auto& path : paths) {
        if (!is_sensitive(path)) {
            safe.push_back(path);
            continue;
        }
        ++filtered;
        if (logger) {
            logger->debug("Filtered sensitive file: {}", Utils::path_to_utf8(path));
        }
    }

    if (filtered > 0 && logger) {
        logger->info("Filtered {} sensitive files from {} total", filtered, paths.size());
    }
    return safe;
}

std::string SensitiveContentClassifier::create_skip_report(const std::vector<fs::path>& skipped) const
{
    if (skipped.empty()) {
        return "No sensitive files skipped.";
    }

    std::map<std::string, std::vector<std::string>> by_reason;
    for (const auto& path : skipped) {
        const std::string reason = sensitivity_reason(path).value_or("Unknown");
        by_reason[reason].push_back(Utils::generic_utf8(path));
    }

    const std::string rule(60, '=');
    std::ostringstream report;
    report << "Sensitive Files Skipped for Privacy:\n" << rule << "\n";
    for (auto& [reason, files] : by_reason) {
        std::sort(files.begin(), files.end());
        report << "\n" << reason << " (" << files.size() << " files):\n";
        for (const auto& file : files) {
            report << "  - " << file << "\n";
        }
    }
    report << "\n" << rule << "\n"
           << "Total: " << skipped.size() << " sensitive files protected\n\n"
           << "These files were NOT read or analyzed for your privacy and security.";
    return report.str();
}
