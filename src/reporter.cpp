#include "reporter.hpp"
#include "json.hpp"
#include <fmt/format.h>

namespace doclint {

void Report::add(ScanResult result) {
    if (result.clean()) return;
    auto key = result.path;
    files_[std::move(key)] = std::move(result);
}

size_t Report::match_count() const {
    size_t n = 0;
    for (const auto& [path, result] : files_) n += result.matches.size();
    return n;
}

const ScanResult* Report::find(const std::string& path) const {
    auto it = files_.find(path);
    return it != files_.end() ? &it->second : nullptr;
}

std::optional<ReportFormat> parse_report_format(std::string_view name) {
    if (name == "text") return ReportFormat::Text;
    if (name == "json") return ReportFormat::Json;
    return std::nullopt;
}

std::string format_text(const Report& report) {
    std::string out = "Disallowed patterns found in the following files:\n";
    for (const auto& [path, result] : report.files()) {
        for (const auto& m : result.matches) {
            out += fmt::format("{}: {} found in line [{}]\n", path, m.pattern, m.line);
        }
    }
    return out;
}

std::string format_json(const Report& report) {
    json::Array files;
    for (const auto& [path, result] : report.files()) {
        json::Array matches;
        for (const auto& m : result.matches) {
            matches.push_back(json::Object{{"pattern", m.pattern}, {"line", m.line}});
        }
        files.push_back(json::Object{{"path", path}, {"matches", std::move(matches)}});
    }
    json::Value doc(json::Object{{"files", std::move(files)}});
    return doc.dump() + "\n";
}

std::string format_report(const Report& report, ReportFormat format) {
    return format == ReportFormat::Json ? format_json(report) : format_text(report);
}

} // namespace doclint
