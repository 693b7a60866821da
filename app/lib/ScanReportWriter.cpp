#include "ScanReportWriter.hpp"

#include <sstream>

namespace {

std::string json_to_string(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

Json::Value to_json_array(const std::vector<std::string>& values)
{
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

const char* yes_no(bool value)
{
    return value ? "yes" : "no";
}

} // namespace


std::string ScanReportWriter::to_text(const ScanReport& report)
{
    const ProjectStats& stats = report.stats;
    std::ostringstream out;
    out << "Project: " << report.project_path << "\n"
        << "Scanned at: " << report.timestamp << "\n"
        << "Files: " << stats.total_files << " total, " << stats.files_analyzed << " analyzed\n"
        << "Size: " << stats.total_size_bytes << " bytes, " << stats.total_lines << " lines\n";

    if (!stats.files_by_extension.empty()) {
        out << "By extension:\n";
        for (const auto& [extension, count] : stats.files_by_extension) {
            out << "  " << extension << ": " << count << "\n";
        }
    }

    out << "Tests detected: " << yes_no(stats.has_tests) << "\n"
        << "Git repository: " << yes_no(stats.is_git_repo) << "\n"
        << report.sensitive_files_skipped.size() << " sensitive files skipped\n"
        << report.inaccessible_paths << " paths inaccessible\n";

    if (report.truncated) {
        out << "Scan stopped early: file limit reached\n";
    }
    for (const auto& warning : report.warnings) {
        out << "warning: " << warning << "\n";
    }
    return out.str();
}

Json::Value ScanReportWriter::to_json_value(const ScanReport& report)
{
    const ProjectStats& stats = report.stats;

    Json::Value by_extension(Json::objectValue);
    for (const auto& [extension, count] : stats.files_by_extension) {
        by_extension[extension] = static_cast<Json::UInt64>(count);
    }

    Json::Value stats_json(Json::objectValue);
    stats_json["total_files"] = static_cast<Json::UInt64>(stats.total_files);
    stats_json["files_analyzed"] = static_cast<Json::UInt64>(stats.files_analyzed);
    stats_json["total_size_bytes"] = static_cast<Json::UInt64>(stats.total_size_bytes);
    stats_json["total_lines"] = static_cast<Json::UInt64>(stats.total_lines);
    stats_json["files_by_extension"] = by_extension;
    stats_json["has_tests"] = stats.has_tests;
    stats_json["is_git_repo"] = stats.is_git_repo;

    Json::Value root(Json::objectValue);
    root["project_path"] = report.project_path;
    root["timestamp"] = report.timestamp;
    root["stats"] = stats_json;
    root["sensitive_files_skipped"] = to_json_array(report.sensitive_files_skipped);
    root["warnings"] = to_json_array(report.warnings);
    root["inaccessible_paths"] = static_cast<Json::UInt64>(report.inaccessible_paths);
    root["truncated"] = report.truncated;
    return root;
}

std::string ScanReportWriter::to_json(const ScanReport& report)
{
    return json_to_string(to_json_value(report));
}

std::string ScanReportWriter::audit_to_text(const std::vector<SensitiveMatch>& matches)
{
    std::ostringstream out;
    for (const auto& match : matches) {
        out << match.path << " [" << to_string(match.type) << "]: " << match.reason << "\n";
    }
    out << "Found " << matches.size() << " sensitive items\n";
    return out.str();
}

std::string ScanReportWriter::audit_to_json(const std::vector<SensitiveMatch>& matches)
{
    Json::Value items(Json::arrayValue);
    for (const auto& match : matches) {
        Json::Value item(Json::objectValue);
        item["path"] = match.path;
        item["reason"] = match.reason;
        item["type"] = to_string(match.type);
        item["category"] = to_string(match.category);
        items.append(item);
    }
    return json_to_string(items);
}
