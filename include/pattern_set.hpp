#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <expected>

namespace doclint {

enum class PatternError {
    EmptyPattern,
    MultiLinePattern
};

struct PatternErrorInfo {
    PatternError error;
    std::string message;
};

// Ordered literal substrings, matched case-insensitively without any
// word-boundary logic. Patterns are stored lower-cased.
class PatternSet {
public:
    PatternSet() = default;

    // Abbreviations that trip up screen readers and non-native readers
    static PatternSet defaults();

    // Lower-cases each entry and drops repeats, keeping first occurrence
    static std::expected<PatternSet, PatternErrorInfo> from_list(
        const std::vector<std::string>& patterns
    );

    const std::vector<std::string>& patterns() const { return patterns_; }
    bool empty() const { return patterns_.empty(); }
    size_t size() const { return patterns_.size(); }

    // Patterns contained in already lower-cased text, in set order
    std::vector<std::string_view> find_in(std::string_view lowered) const;

private:
    std::vector<std::string> patterns_;
};

} // namespace doclint
