#include "reporter.hpp"
#include "json.hpp"
#include <cassert>
#include <iostream>
#include <string>

using namespace doclint;

int main() {
    Report report;
    assert(report.empty());
    report.add(ScanResult{"/repo/src/clean.md", {}});
    assert(report.empty());
    std::cout << "✓ Clean results are not recorded\n";

    report.add(ScanResult{"/repo/src/zeta.md", {{" etc", "apples, pears etc"}}});
    report.add(ScanResult{"/repo/src/alpha.md", {{"i.e.", "that is, i.e. this"}, {"e.g.", "see e.g. that"}}});
    assert(report.size() == 2);
    assert(report.match_count() == 3);
    assert(report.find("/repo/src/alpha.md") != nullptr);
    assert(report.find("/repo/src/clean.md") == nullptr);

    const std::string expected =
        "Disallowed patterns found in the following files:\n"
        "/repo/src/alpha.md: i.e. found in line [that is, i.e. this]\n"
        "/repo/src/alpha.md: e.g. found in line [see e.g. that]\n"
        "/repo/src/zeta.md:  etc found in line [apples, pears etc]\n";
    assert(format_text(report) == expected);
    assert(format_report(report, ReportFormat::Text) == expected);
    std::cout << "✓ Text report sorted by path\n";

    auto doc = json::parse(format_report(report, ReportFormat::Json));
    const auto& files = doc["files"].as_array();
    assert(files.size() == 2);
    assert(files[0]["path"].as_string() == "/repo/src/alpha.md");
    assert(files[0]["matches"].as_array().size() == 2);
    assert(files[0]["matches"].as_array()[1]["pattern"].as_string() == "e.g.");
    assert(files[1]["matches"].as_array()[0]["line"].as_string() == "apples, pears etc");
    std::cout << "✓ JSON report\n";

    // Re-adding a path replaces its entry
    report.add(ScanResult{"/repo/src/zeta.md", {{"et cetera", "and et cetera"}}});
    assert(report.size() == 2);
    assert(report.find("/repo/src/zeta.md")->matches[0].pattern == "et cetera");

    assert(parse_report_format("text") == ReportFormat::Text);
    assert(parse_report_format("json") == ReportFormat::Json);
    assert(!parse_report_format("xml"));
    std::cout << "✓ Report formats\n";
    return 0;
}
