#include <catch2/catch_test_macros.hpp>
#include "SensitiveContentClassifier.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct SensitiveProject {
    TempDir temp_dir;
    fs::path root;

    SensitiveProject() : root(temp_dir.path()) {
        write_file(root / "src" / "main.py", "print('hello')");
        write_file(root / "README.md", "# Project");
        write_file(root / ".env", "API_KEY=secret123");
        write_file(root / ".env.production", "API_KEY=prod_secret");
        write_file(root / "credentials.json", "{\"key\": \"secret\"}");
        write_file(root / "id_rsa", "PRIVATE KEY");
        write_file(root / "cert.pem", "CERTIFICATE");
        write_file(root / ".ssh" / "config", "Host github.com");
        write_file(root / ".ssh" / "id_rsa", "PRIVATE KEY");
    }
};

bool has_path_ending_with(const std::vector<SensitiveMatch>& matches, const std::string& suffix) {
    return std::any_of(matches.begin(), matches.end(), [&](const SensitiveMatch& match) {
        return match.path.size() >= suffix.size() &&
               match.path.compare(match.path.size() - suffix.size(), suffix.size(), suffix) == 0;
    });
}

}

TEST_CASE("environment files are sensitive") {
    SensitiveContentClassifier classifier;
    CHECK(classifier.is_sensitive(".env"));
    CHECK(classifier.is_sensitive(".env.local"));
    CHECK(classifier.is_sensitive(".env.production"));
    CHECK(classifier.is_sensitive("env.staging"));

    const auto reason = classifier.sensitivity_reason(".env");
    REQUIRE(reason.has_value());
    CHECK(*reason == "Environment variables");
}

TEST_CASE("credential and secret files are sensitive") {
    SensitiveContentClassifier classifier;
    for (const char* name : {"credentials.json", "credentials.yaml", "credentials.yml",
                             "service-account.json", "service-account-prod.json",
                             "secrets.json", "secrets.yaml", "secrets.yml", ".secrets",
                             ".api-keys.json", "api_keys.txt", ".npmrc", ".pypirc",
                             "database.yml", "database.yaml", "db.yml",
                             "passwords.txt", "password.txt", "passwd"}) {
        INFO(name);
        CHECK(classifier.is_sensitive(name));
    }
}

TEST_CASE("private keys and certificates are sensitive") {
    SensitiveContentClassifier classifier;
    for (const char* name : {"id_rsa", "id_dsa", "id_ecdsa", "id_ed25519", "deploy_rsa",
                             "cert.pem", "private.pem", "server.key", "certificate.key",
                             "store.jks", "release.keystore"}) {
        INFO(name);
        CHECK(classifier.is_sensitive(name));
    }
}

TEST_CASE("cloud provider credentials are matched on the whole path") {
    SensitiveContentClassifier classifier;
    CHECK(classifier.is_sensitive(".gcp/credentials"));

    // The directory rule fires before the path pattern
    const auto verdict = classifier.classify(".aws/credentials");
    CHECK(verdict.is_sensitive);
    CHECK(verdict.category == SensitivityCategory::Directory);
    CHECK(verdict.reason == std::optional<std::string>("In sensitive directory: .aws"));
}

TEST_CASE("sensitive directories cover everything beneath them") {
    SensitiveContentClassifier classifier;
    CHECK(classifier.is_sensitive(".ssh"));
    CHECK(classifier.is_sensitive(".ssh/config"));
    CHECK(classifier.is_sensitive(".ssh/known_hosts"));
    CHECK(classifier.is_sensitive(".git"));
    CHECK(classifier.is_sensitive(".git/config"));
    CHECK(classifier.is_sensitive("deploy/Secrets/notes.md"));
}

TEST_CASE("ordinary project files are not sensitive") {
    SensitiveContentClassifier classifier;
    for (const char* name : {"main.py", "README.md", "package.json", "requirements.txt",
                             "Dockerfile", "test_main.py", "tests/test_auth.py",
                             "src/keyboard.cpp", "docs/environment.md"}) {
        INFO(name);
        const auto verdict = classifier.classify(name);
        CHECK_FALSE(verdict.is_sensitive);
        CHECK_FALSE(verdict.reason.has_value());
        CHECK(verdict.category == SensitivityCategory::None);
    }
}

TEST_CASE("classification is case-insensitive") {
    SensitiveContentClassifier classifier;
    CHECK(classifier.is_sensitive(".ENV"));
    CHECK(classifier.is_sensitive("Credentials.JSON"));
    CHECK(classifier.is_sensitive(".SSH/config"));
    CHECK(classifier.is_sensitive("backup/server.PFX"));
}

TEST_CASE("the first matching rule supplies the reason") {
    SensitiveContentClassifier classifier;

    SECTION("directory beats filename") {
        const auto verdict = classifier.classify(".ssh/id_rsa");
        CHECK(verdict.category == SensitivityCategory::Directory);
        CHECK(verdict.reason == std::optional<std::string>("In sensitive directory: .ssh"));
    }

    SECTION("filename pattern beats extension") {
        const auto verdict = classifier.classify("cert.pem");
        CHECK(verdict.category == SensitivityCategory::FilenamePattern);
        CHECK(verdict.reason == std::optional<std::string>("PEM certificate/key"));
    }

    SECTION("pattern table order is kept") {
        CHECK(classifier.sensitivity_reason("id_rsa") == std::optional<std::string>("SSH private key"));
        CHECK(classifier.sensitivity_reason("deploy_rsa") == std::optional<std::string>("RSA private key"));
    }

    SECTION("extension rule alone") {
        const auto verdict = classifier.classify("app/release.keystore");
        CHECK(verdict.category == SensitivityCategory::Extension);
        CHECK(verdict.reason == std::optional<std::string>("Sensitive file extension: .keystore"));
    }
}

TEST_CASE("custom rules extend the built-in tables") {
    SensitivityRules rules;
    rules.extra_patterns = {R"(internal-.*\.txt)"};
    rules.extra_directories = {"Internal", " vault "};
    rules.extra_extensions = {"kdbx", ".gpg"};
    SensitiveContentClassifier classifier(rules);

    CHECK(classifier.is_sensitive("internal-notes.txt"));
    CHECK(classifier.is_sensitive("internal-passwords.txt"));
    CHECK_FALSE(classifier.is_sensitive("external-notes.txt"));
    CHECK(classifier.sensitivity_reason("internal-notes.txt") ==
          std::optional<std::string>("Custom sensitive pattern"));

    CHECK(classifier.is_sensitive("internal/file.txt"));
    CHECK(classifier.is_sensitive("vault/data.json"));
    CHECK_FALSE(classifier.is_sensitive("public/file.txt"));

    CHECK(classifier.is_sensitive("passwords.kdbx"));
    CHECK(classifier.sensitivity_reason("mail.gpg") ==
          std::optional<std::string>("Sensitive file extension: .gpg"));

    SensitiveContentClassifier defaults;
    CHECK(classifier.pattern_count() == defaults.pattern_count() + 1);
    CHECK(classifier.directory_count() == defaults.directory_count() + 2);
}

TEST_CASE("an invalid custom pattern is a configuration error") {
    SensitivityRules rules;
    rules.extra_patterns = {"([unclosed"};
    CHECK(capture_error_code([&] { SensitiveContentClassifier classifier(rules); })
          == ErrorCodes::Code::CONFIG_INVALID_PATTERN);
}

TEST_CASE("should_skip_content pairs the verdict with its reason") {
    SensitiveContentClassifier classifier;

    const auto [skip, reason] = classifier.should_skip_content(".env");
    CHECK(skip);
    CHECK(reason == std::optional<std::string>("Environment variables"));

    const auto [keep, no_reason] = classifier.should_skip_content("main.py");
    CHECK_FALSE(keep);
    CHECK_FALSE(no_reason.has_value());
}

TEST_CASE("scan_directory finds sensitive entries without reading them") {
    SensitiveProject project;
    SensitiveContentClassifier classifier;

    SECTION("recursive") {
        const auto matches = classifier.scan_directory(project.root);
        CHECK(has_path_ending_with(matches, "/.env"));
        CHECK(has_path_ending_with(matches, "/.env.production"));
        CHECK(has_path_ending_with(matches, "/credentials.json"));
        CHECK(has_path_ending_with(matches, "/id_rsa"));
        CHECK(has_path_ending_with(matches, "/cert.pem"));
        CHECK(has_path_ending_with(matches, "/.ssh"));
        CHECK(has_path_ending_with(matches, "/.ssh/config"));
        CHECK_FALSE(has_path_ending_with(matches, "/main.py"));
        CHECK_FALSE(has_path_ending_with(matches, "/README.md"));

        for (const auto& match : matches) {
            CHECK(fs::path(match.path).is_absolute());
            CHECK_FALSE(match.reason.empty());
        }
        const auto ssh = std::find_if(matches.begin(), matches.end(), [&](const SensitiveMatch& m) {
            return fs::path(m.path) == project.root / ".ssh";
        });
        REQUIRE(ssh != matches.end());
        CHECK(ssh->type == EntryType::Directory);
        CHECK(ssh->category == SensitivityCategory::Directory);
    }

    SECTION("top level only") {
        const auto matches = classifier.scan_directory(project.root, false);
        CHECK(has_path_ending_with(matches, "/.ssh"));
        CHECK_FALSE(has_path_ending_with(matches, "/.ssh/config"));
        CHECK(has_path_ending_with(matches, "/.env"));
    }

    SECTION("directories above the scanned root do not count") {
        write_file(project.root / "secrets" / "nested" / "plain.txt");
        SensitiveContentClassifier plain;
        const auto matches = plain.scan_directory(project.root / "secrets" / "nested");
        CHECK(matches.empty());
    }
}

TEST_CASE("filter_safe keeps only non-sensitive paths in order") {
    SensitiveContentClassifier classifier;
    const std::vector<fs::path> files{"src/main.py", ".env", "README.md", "credentials.json",
                                      "tests/test_main.py", ".ssh/id_rsa"};

    const auto safe = classifier.filter_safe(files);
    CHECK(safe == std::vector<fs::path>{"src/main.py", "README.md", "tests/test_main.py"});
    CHECK(classifier.filter_safe({}).empty());
}

TEST_CASE("create_skip_report groups skipped files by reason") {
    SensitiveContentClassifier classifier;

    CHECK(classifier.create_skip_report({}) == "No sensitive files skipped.");

    const std::string report =
        classifier.create_skip_report({".env", ".env.local", "credentials.json"});
    CHECK(report.find("Sensitive Files Skipped for Privacy:") == 0);
    CHECK(report.find(std::string(60, '=')) != std::string::npos);
    CHECK(report.find("Environment variables (1 files):") != std::string::npos);
    CHECK(report.find("Environment variables (specific environment) (1 files):") != std::string::npos);
    CHECK(report.find("GCP/AWS credentials (1 files):") != std::string::npos);
    CHECK(report.find("  - credentials.json") != std::string::npos);
    CHECK(report.find("Total: 3 sensitive files protected") != std::string::npos);
    CHECK(report.find("NOT read or analyzed") != std::string::npos);
}

TEST_CASE("scan_directory continues past unreadable directories") {
    SensitiveContentClassifier classifier;

    SECTION("missing root yields no matches") {
        TempDir temp_dir;
        CHECK(classifier.scan_directory(temp_dir.path() / "gone").empty());
    }

    SECTION("locked subdirectory") {
        if (!permissions_are_enforced()) {
            SUCCEED("running as root; permission bits are not enforced");
            return;
        }
        TempDir temp_dir;
        const fs::path root = temp_dir.path();
        write_file(root / "a_dir" / ".env");
        write_file(root / "m_locked" / "inner" / "id_rsa");
        write_file(root / "z_dir" / ".env");
        LockedDirectory lock(root / "m_locked");

        const auto matches = classifier.scan_directory(root);
        CHECK(has_path_ending_with(matches, "/a_dir/.env"));
        CHECK(has_path_ending_with(matches, "/z_dir/.env"));
    }
}
