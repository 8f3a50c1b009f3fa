#include "pattern_set.hpp"
#include "text_reader.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace doclint {

PatternSet PatternSet::defaults() {
    PatternSet set;
    set.patterns_ = {
        "i.e.", "i.e ", " ie ", "e.g.", "e.g ", "e.t.c.", " etc", "et cetera"
    };
    return set;
}

std::expected<PatternSet, PatternErrorInfo> PatternSet::from_list(
    const std::vector<std::string>& patterns
) {
    PatternSet set;
    for (const auto& raw : patterns) {
        if (raw.empty()) {
            return std::unexpected(PatternErrorInfo{PatternError::EmptyPattern,
                "Empty pattern would match every file"});
        }
        if (raw.find_first_of("\r\n") != std::string::npos) {
            return std::unexpected(PatternErrorInfo{PatternError::MultiLinePattern,
                fmt::format("Pattern spans lines and can never be reported: '{}'", raw)});
        }
        auto lowered = to_lower(raw);
        if (std::find(set.patterns_.begin(), set.patterns_.end(), lowered) == set.patterns_.end()) {
            set.patterns_.push_back(std::move(lowered));
        }
    }
    return set;
}

std::vector<std::string_view> PatternSet::find_in(std::string_view lowered) const {
    std::vector<std::string_view> found;
    for (const auto& p : patterns_) {
        if (lowered.find(p) != std::string_view::npos) found.emplace_back(p);
    }
    return found;
}

} // namespace doclint
