#ifndef SCAN_REPORT_WRITER_HPP
#define SCAN_REPORT_WRITER_HPP

#include "ProjectScanner.hpp"
#include "Types.hpp"

#include <json/json.h>
#include <string>
#include <vector>

class ScanReportWriter {
public:
    static std::string to_text(const ScanReport& report);
    static Json::Value to_json_value(const ScanReport& report);
    static std::string to_json(const ScanReport& report);

    static std::string audit_to_text(const std::vector<SensitiveMatch>& matches);
    static std::string audit_to_json(const std::vector<SensitiveMatch>& matches);
};

#endif
