#include "scanner.hpp"
#include "comment_stripper.hpp"
#include "text_reader.hpp"
#include "compact_log.hpp"
#include <fmt/format.h>

namespace doclint {

const Match* ScanResult::find(std::string_view pattern) const {
    for (const auto& m : matches) {
        if (m.pattern == pattern) return &m;
    }
    return nullptr;
}

Scanner::Scanner(PatternSet patterns) : patterns_(std::move(patterns)) {}

// Line holding the byte at pos, without its terminating newline
static std::string_view line_at(std::string_view text, size_t pos) {
    auto start = text.rfind('\n', pos);
    start = start == std::string_view::npos ? 0 : start + 1;
    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) end = text.size();
    return text.substr(start, end - start);
}

ScanResult Scanner::scan_text(std::string_view text, std::string path) const {
    ScanResult result;
    result.path = std::move(path);
    if (patterns_.empty()) return result;

    auto lowered = to_lower(strip_comments(text));
    std::string_view view(lowered);
    for (auto pattern : patterns_.find_in(view)) {
        // Patterns never contain '\n', so the last occurrence sits on the
        // last line containing the pattern
        auto pos = view.rfind(pattern);
        if (pos == std::string_view::npos) continue;
        result.matches.push_back(Match{std::string(pattern), std::string(line_at(view, pos))});
    }
    return result;
}

ScanResult Scanner::scan_file(const std::filesystem::path& file_path) const {
    auto text = read_text_file(file_path);
    if (!text) {
        compact::Writer::debug(fmt::format("skip {}", text.error().message));
        return ScanResult{file_path.string(), {}};
    }
    return scan_text(*text, file_path.string());
}

} // namespace doclint
