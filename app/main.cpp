#include "AppException.hpp"
#include "Logger.hpp"
#include "ProjectScanner.hpp"
#include "ScanReportWriter.hpp"
#include "Settings.hpp"
#include "Utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>


namespace {

struct ParsedArguments {
    std::string project_root;
    std::string config_file;
    std::optional<std::size_t> max_depth;
    std::optional<std::size_t> max_files;
    bool json_output{false};
    bool audit{false};
    bool recursive{true};
    bool verbose{false};
    bool skip_report{false};
    bool write_config{false};
    bool show_help{false};
};

void print_usage(std::FILE* stream)
{
    std::fprintf(stream,
        "Usage: scanguard <project-root> [options]\n"
        "\n"
        "Options:\n"
        "  --max-depth N       Do not descend more than N levels below the root\n"
        "  --max-files N       Stop after analyzing N files\n"
        "  --config FILE       Read settings from FILE instead of the default location\n"
        "  --json              Print the report as JSON\n"
        "  --audit             List sensitive files and directories instead of scanning\n"
        "  --no-recursive      With --audit, only inspect the top level\n"
        "  --skip-report       Append the list of skipped sensitive files\n"
        "  --write-config      Save the effective settings to the config file and exit\n"
        "  --verbose           Enable debug logging\n"
        "  --help              Show this help\n");
}

std::size_t parse_count(const char* flag, const char* value)
{
    const std::string text = value;
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(std::string(flag) + " expects a non-negative integer, got '" + text + "'");
    }
    return static_cast<std::size_t>(std::stoull(text));
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto require_value = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::string(flag) + " requires a value");
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            parsed.show_help = true;
        } else if (std::strcmp(arg, "--max-depth") == 0) {
            parsed.max_depth = parse_count(arg, require_value(arg));
        } else if (std::strcmp(arg, "--max-files") == 0) {
            parsed.max_files = parse_count(arg, require_value(arg));
        } else if (std::strcmp(arg, "--config") == 0) {
            parsed.config_file = require_value(arg);
        } else if (std::strcmp(arg, "--json") == 0) {
            parsed.json_output = true;
        } else if (std::strcmp(arg, "--audit") == 0) {
            parsed.audit = true;
        } else if (std::strcmp(arg, "--no-recursive") == 0) {
            parsed.recursive = false;
        } else if (std::strcmp(arg, "--skip-report") == 0) {
            parsed.skip_report = true;
        } else if (std::strcmp(arg, "--write-config") == 0) {
            parsed.write_config = true;
        } else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            parsed.verbose = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            throw std::invalid_argument(std::string("Unknown option: ") + arg);
        } else if (parsed.project_root.empty()) {
            parsed.project_root = arg;
        } else {
            throw std::invalid_argument(std::string("Unexpected argument: ") + arg);
        }
    }
    if (parsed.project_root.empty() && !parsed.show_help && !parsed.write_config) {
        throw std::invalid_argument("Missing project root");
    }
    return parsed;
}

bool initialize_loggers(const Settings& settings, bool verbose)
{
    LoggerOptions options;
    options.level = verbose ? spdlog::level::debug
                            : Logger::parse_level(settings.get_log_level(), spdlog::level::info);
    options.log_dir = settings.get_log_dir();
    try {
        Logger::setup_loggers(options);
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

int run_audit(const ProjectScanner& scanner, const ParsedArguments& args)
{
    const auto matches = scanner.classifier().scan_directory(scanner.validator().project_root(),
                                                             args.recursive);
    if (args.json_output) {
        std::cout << ScanReportWriter::audit_to_json(matches) << std::endl;
    } else {
        std::cout << ScanReportWriter::audit_to_text(matches);
    }
    return EXIT_SUCCESS;
}

int run_scan(const ProjectScanner& scanner, const ParsedArguments& args)
{
    const ScanReport report = scanner.scan();
    if (args.json_output) {
        std::cout << ScanReportWriter::to_json(report) << std::endl;
    } else {
        std::cout << ScanReportWriter::to_text(report);
    }

    if (args.skip_report) {
        std::vector<std::filesystem::path> skipped;
        skipped.reserve(report.sensitive_files_skipped.size());
        for (const auto& path : report.sensitive_files_skipped) {
            skipped.push_back(Utils::utf8_to_path(path));
        }
        std::cout << "\n" << scanner.classifier().create_skip_report(skipped) << std::endl;
    }
    return EXIT_SUCCESS;
}

int run_application(const ParsedArguments& args)
{
    Settings settings = args.config_file.empty() ? Settings() : Settings(args.config_file);
    const bool loaded = settings.load();
    if (!loaded && !args.config_file.empty() && !args.write_config) {
        THROW_APP_ERROR(ErrorCodes::Code::CONFIG_LOAD_FAILED, "Config file: " + args.config_file);
    }
    if (args.max_depth) {
        settings.set_max_depth(args.max_depth);
    }
    if (args.max_files) {
        settings.set_max_files(args.max_files);
    }

    if (!initialize_loggers(settings, args.verbose)) {
        return EXIT_FAILURE;
    }

    if (args.write_config) {
        if (!settings.save()) {
            THROW_APP_ERROR(ErrorCodes::Code::CONFIG_LOAD_FAILED, "Cannot write " + settings.get_config_path());
        }
        std::cout << "Wrote " << settings.get_config_path() << std::endl;
        return EXIT_SUCCESS;
    }

    ProjectScanner scanner(Utils::utf8_to_path(args.project_root), ScanOptions::from_settings(settings));
    return args.audit ? run_audit(scanner, args) : run_scan(scanner, args);
}

} // namespace


int main(int argc, char **argv) {
    ParsedArguments args;
    try {
        args = parse_command_line(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::fprintf(stderr, "scanguard: %s\n\n", ex.what());
        print_usage(stderr);
        return 2;
    }
    if (args.show_help) {
        print_usage(stdout);
        return EXIT_SUCCESS;
    }

    try {
        return run_application(args);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("{}", ex.get_full_details());
        }
        std::fprintf(stderr, "Error %d: %s\n", ex.get_error_code_int(), ex.what());
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return EXIT_FAILURE;
    }
}
