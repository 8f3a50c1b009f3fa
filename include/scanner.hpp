#pragma once

#include "pattern_set.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

namespace doclint {

struct Match {
    std::string pattern;
    std::string line;  // lower-cased, comments removed

    bool operator==(const Match&) const = default;
};

struct ScanResult {
    std::string path;
    std::vector<Match> matches;  // pattern-set order, one per pattern

    bool clean() const { return matches.empty(); }
    const Match* find(std::string_view pattern) const;
};

class Scanner {
public:
    explicit Scanner(PatternSet patterns);

    // Strip comments, lower-case, then record for each pattern present the
    // last line that contains it. Earlier lines with the same pattern are
    // not reported.
    ScanResult scan_text(std::string_view text, std::string path = {}) const;

    // A file that is missing or unreadable yields a clean result
    ScanResult scan_file(const std::filesystem::path& file_path) const;

    const PatternSet& patterns() const { return patterns_; }

private:
    PatternSet patterns_;
};

} // namespace doclint
