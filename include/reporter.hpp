#pragma once

#include "scanner.hpp"
#include <string>
#include <string_view>
#include <map>
#include <optional>

namespace doclint {

// Files with at least one match, keyed by absolute path. Iteration is
// lexicographic by path, so the rendered output is deterministic.
class Report {
public:
    // Clean results are dropped
    void add(ScanResult result);

    bool empty() const { return files_.empty(); }
    size_t size() const { return files_.size(); }
    size_t match_count() const;

    const std::map<std::string, ScanResult>& files() const { return files_; }
    const ScanResult* find(const std::string& path) const;

private:
    std::map<std::string, ScanResult> files_;
};

enum class ReportFormat {
    Text,
    Json
};

std::optional<ReportFormat> parse_report_format(std::string_view name);

// Header line, then one "<path>: <pattern> found in line [<line>]" line
// per offending file and pattern. A file with several patterns therefore
// yields several lines, grouped under its path in pattern-set order.
std::string format_text(const Report& report);

// {"files":[{"path":...,"matches":[{"pattern":...,"line":...}]}]}
std::string format_json(const Report& report);

std::string format_report(const Report& report, ReportFormat format);

} // namespace doclint
