#include "text_reader.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <system_error>

namespace doclint {

static bool in_range(unsigned char c, unsigned char lo, unsigned char hi) {
    return c >= lo && c <= hi;
}

std::string sanitize_utf8(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        size_t need = 0;
        unsigned char lo = 0x80, hi = 0xBF;  // bounds for the second byte
        if (in_range(lead, 0xC2, 0xDF)) {
            need = 1;
        } else if (in_range(lead, 0xE0, 0xEF)) {
            need = 2;
            if (lead == 0xE0) lo = 0xA0;
            else if (lead == 0xED) hi = 0x9F;
        } else if (in_range(lead, 0xF0, 0xF4)) {
            need = 3;
            if (lead == 0xF0) lo = 0x90;
            else if (lead == 0xF4) hi = 0x8F;
        } else {
            ++i;  // stray continuation or invalid lead
            continue;
        }

        size_t j = i + 1;
        size_t got = 0;
        while (got < need && j < n) {
            auto c = static_cast<unsigned char>(bytes[j]);
            bool ok = got == 0 ? in_range(c, lo, hi) : in_range(c, 0x80, 0xBF);
            if (!ok) break;
            ++j;
            ++got;
        }
        if (got == need) out.append(bytes.substr(i, j - i));
        i = j;
    }
    return out;
}

std::string normalize_newlines(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            out += c;
        }
    }
    return out;
}

namespace {

enum class Step { Offset, Parity };

// Simple lower-case mappings from UnicodeData.txt (Unicode 14.0), packed
// into contiguous upper-case blocks. Offset blocks shift every code point by
// delta; Parity blocks only shift code points whose parity matches lo.
struct CaseRange {
    char32_t lo;
    char32_t hi;
    int32_t delta;
    Step step;
};

constexpr CaseRange kCaseRanges[] = {
    {0x0041, 0x005A, 32, Step::Offset},
    {0x00C0, 0x00D6, 32, Step::Offset},
    {0x00D8, 0x00DE, 32, Step::Offset},
    {0x0100, 0x012F, 1, Step::Parity},
    {0x0132, 0x0137, 1, Step::Parity},
    {0x0139, 0x0148, 1, Step::Parity},
    {0x014A, 0x0177, 1, Step::Parity},
    {0x0179, 0x017E, 1, Step::Parity},
    {0x01A0, 0x01A5, 1, Step::Parity},
    {0x01CB, 0x01DC, 1, Step::Parity},
    {0x01DE, 0x01EF, 1, Step::Parity},
    {0x01F8, 0x021F, 1, Step::Parity},
    {0x0222, 0x0233, 1, Step::Parity},
    {0x0246, 0x024F, 1, Step::Parity},
    {0x0388, 0x038A, 37, Step::Offset},
    {0x0391, 0x03A1, 32, Step::Offset},
    {0x03A3, 0x03AB, 32, Step::Offset},
    {0x03D8, 0x03EF, 1, Step::Parity},
    {0x03FD, 0x03FF, -130, Step::Offset},
    {0x0400, 0x040F, 80, Step::Offset},
    {0x0410, 0x042F, 32, Step::Offset},
    {0x0460, 0x0481, 1, Step::Parity},
    {0x048A, 0x04BF, 1, Step::Parity},
    {0x04C1, 0x04CE, 1, Step::Parity},
    {0x04D0, 0x052F, 1, Step::Parity},
    {0x0531, 0x0556, 48, Step::Offset},
    {0x10A0, 0x10C5, 7264, Step::Offset},
    {0x13A0, 0x13EF, 38864, Step::Offset},
    {0x13F0, 0x13F5, 8, Step::Offset},
    {0x1C90, 0x1CBA, -3008, Step::Offset},
    {0x1CBD, 0x1CBF, -3008, Step::Offset},
    {0x1E00, 0x1E95, 1, Step::Parity},
    {0x1EA0, 0x1EFF, 1, Step::Parity},
    {0x1F08, 0x1F0F, -8, Step::Offset},
    {0x1F18, 0x1F1D, -8, Step::Offset},
    {0x1F28, 0x1F2F, -8, Step::Offset},
    {0x1F38, 0x1F3F, -8, Step::Offset},
    {0x1F48, 0x1F4D, -8, Step::Offset},
    {0x1F68, 0x1F6F, -8, Step::Offset},
    {0x1F88, 0x1F8F, -8, Step::Offset},
    {0x1F98, 0x1F9F, -8, Step::Offset},
    {0x1FA8, 0x1FAF, -8, Step::Offset},
    {0x1FC8, 0x1FCB, -86, Step::Offset},
    {0x2160, 0x216F, 16, Step::Offset},
    {0x24B6, 0x24CF, 26, Step::Offset},
    {0x2C00, 0x2C2F, 48, Step::Offset},
    {0x2C67, 0x2C6C, 1, Step::Parity},
    {0x2C80, 0x2CE3, 1, Step::Parity},
    {0xA640, 0xA66D, 1, Step::Parity},
    {0xA680, 0xA69B, 1, Step::Parity},
    {0xA722, 0xA72F, 1, Step::Parity},
    {0xA732, 0xA76F, 1, Step::Parity},
    {0xA77E, 0xA787, 1, Step::Parity},
    {0xA796, 0xA7A9, 1, Step::Parity},
    {0xA7B4, 0xA7C3, 1, Step::Parity},
    {0xFF21, 0xFF3A, 32, Step::Offset},
    {0x10400, 0x10427, 40, Step::Offset},
    {0x104B0, 0x104D3, 40, Step::Offset},
    {0x10570, 0x1057A, 39, Step::Offset},
    {0x1057C, 0x1058A, 39, Step::Offset},
    {0x1058C, 0x10592, 39, Step::Offset},
    {0x10C80, 0x10CB2, 64, Step::Offset},
    {0x118A0, 0x118BF, 32, Step::Offset},
    {0x16E40, 0x16E5F, 32, Step::Offset},
    {0x1E900, 0x1E921, 34, Step::Offset},
};

struct CasePair {
    char32_t upper;
    char32_t lower;
};

// Irregular single mappings, sorted by upper
constexpr CasePair kCasePairs[] = {
    {0x0178, 0x00FF}, {0x0181, 0x0253}, {0x0182, 0x0183}, {0x0184, 0x0185},
    {0x0186, 0x0254}, {0x0187, 0x0188}, {0x0189, 0x0256}, {0x018A, 0x0257},
    {0x018B, 0x018C}, {0x018E, 0x01DD}, {0x018F, 0x0259}, {0x0190, 0x025B},
    {0x0191, 0x0192}, {0x0193, 0x0260}, {0x0194, 0x0263}, {0x0196, 0x0269},
    {0x0197, 0x0268}, {0x0198, 0x0199}, {0x019C, 0x026F}, {0x019D, 0x0272},
    {0x019F, 0x0275}, {0x01A6, 0x0280}, {0x01A7, 0x01A8}, {0x01A9, 0x0283},
    {0x01AC, 0x01AD}, {0x01AE, 0x0288}, {0x01AF, 0x01B0}, {0x01B1, 0x028A},
    {0x01B2, 0x028B}, {0x01B3, 0x01B4}, {0x01B5, 0x01B6}, {0x01B7, 0x0292},
    {0x01B8, 0x01B9}, {0x01BC, 0x01BD}, {0x01C4, 0x01C6}, {0x01C5, 0x01C6},
    {0x01C7, 0x01C9}, {0x01C8, 0x01C9}, {0x01CA, 0x01CC}, {0x01F1, 0x01F3},
    {0x01F2, 0x01F3}, {0x01F4, 0x01F5}, {0x01F6, 0x0195}, {0x01F7, 0x01BF},
    {0x0220, 0x019E}, {0x023A, 0x2C65}, {0x023B, 0x023C}, {0x023D, 0x019A},
    {0x023E, 0x2C66}, {0x0241, 0x0242}, {0x0243, 0x0180}, {0x0244, 0x0289},
    {0x0245, 0x028C}, {0x0370, 0x0371}, {0x0372, 0x0373}, {0x0376, 0x0377},
    {0x037F, 0x03F3}, {0x0386, 0x03AC}, {0x038C, 0x03CC}, {0x038E, 0x03CD},
    {0x038F, 0x03CE}, {0x03CF, 0x03D7}, {0x03F4, 0x03B8}, {0x03F7, 0x03F8},
    {0x03F9, 0x03F2}, {0x03FA, 0x03FB}, {0x04C0, 0x04CF}, {0x10C7, 0x2D27},
    {0x10CD, 0x2D2D}, {0x1E9E, 0x00DF}, {0x1F59, 0x1F51}, {0x1F5B, 0x1F53},
    {0x1F5D, 0x1F55}, {0x1F5F, 0x1F57}, {0x1FB8, 0x1FB0}, {0x1FB9, 0x1FB1},
    {0x1FBA, 0x1F70}, {0x1FBB, 0x1F71}, {0x1FBC, 0x1FB3}, {0x1FCC, 0x1FC3},
    {0x1FD8, 0x1FD0}, {0x1FD9, 0x1FD1}, {0x1FDA, 0x1F76}, {0x1FDB, 0x1F77},
    {0x1FE8, 0x1FE0}, {0x1FE9, 0x1FE1}, {0x1FEA, 0x1F7A}, {0x1FEB, 0x1F7B},
    {0x1FEC, 0x1FE5}, {0x1FF8, 0x1F78}, {0x1FF9, 0x1F79}, {0x1FFA, 0x1F7C},
    {0x1FFB, 0x1F7D}, {0x1FFC, 0x1FF3}, {0x2126, 0x03C9}, {0x212A, 0x006B},
    {0x212B, 0x00E5}, {0x2132, 0x214E}, {0x2183, 0x2184}, {0x2C60, 0x2C61},
    {0x2C62, 0x026B}, {0x2C63, 0x1D7D}, {0x2C64, 0x027D}, {0x2C6D, 0x0251},
    {0x2C6E, 0x0271}, {0x2C6F, 0x0250}, {0x2C70, 0x0252}, {0x2C72, 0x2C73},
    {0x2C75, 0x2C76}, {0x2C7E, 0x023F}, {0x2C7F, 0x0240}, {0x2CEB, 0x2CEC},
    {0x2CED, 0x2CEE}, {0x2CF2, 0x2CF3}, {0xA779, 0xA77A}, {0xA77B, 0xA77C},
    {0xA77D, 0x1D79}, {0xA78B, 0xA78C}, {0xA78D, 0x0265}, {0xA790, 0xA791},
    {0xA792, 0xA793}, {0xA7AA, 0x0266}, {0xA7AB, 0x025C}, {0xA7AC, 0x0261},
    {0xA7AD, 0x026C}, {0xA7AE, 0x026A}, {0xA7B0, 0x029E}, {0xA7B1, 0x0287},
    {0xA7B2, 0x029D}, {0xA7B3, 0xAB53}, {0xA7C4, 0xA794}, {0xA7C5, 0x0282},
    {0xA7C6, 0x1D8E}, {0xA7C7, 0xA7C8}, {0xA7C9, 0xA7CA}, {0xA7D0, 0xA7D1},
    {0xA7D6, 0xA7D7}, {0xA7D8, 0xA7D9}, {0xA7F5, 0xA7F6}, {0x10594, 0x105BB},
    {0x10595, 0x105BC},
};

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Length of the well-formed sequence at text[i], or 0
size_t decode_utf8(std::string_view text, size_t i, char32_t& cp) {
    auto lead = static_cast<unsigned char>(text[i]);
    size_t need = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if (in_range(lead, 0xC2, 0xDF)) {
        need = 1;
        cp = lead & 0x1F;
    } else if (in_range(lead, 0xE0, 0xEF)) {
        need = 2;
        cp = lead & 0x0F;
        if (lead == 0xE0) lo = 0xA0;
        else if (lead == 0xED) hi = 0x9F;
    } else if (in_range(lead, 0xF0, 0xF4)) {
        need = 3;
        cp = lead & 0x07;
        if (lead == 0xF0) lo = 0x90;
        else if (lead == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (i + need >= text.size()) return 0;
    for (size_t k = 1; k <= need; ++k) {
        auto c = static_cast<unsigned char>(text[i + k]);
        if (k == 1 ? !in_range(c, lo, hi) : !in_range(c, 0x80, 0xBF)) return 0;
        cp = (cp << 6) | (c & 0x3F);
    }
    return need + 1;
}

} // namespace

char32_t to_lower(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp + 32 : cp;
    }
    for (const auto& range : kCaseRanges) {
        if (cp < range.lo) break;
        if (cp > range.hi) continue;
        if (range.step == Step::Parity && ((cp - range.lo) & 1) != 0) return cp;
        return static_cast<char32_t>(static_cast<int32_t>(cp) + range.delta);
    }
    auto it = std::lower_bound(std::begin(kCasePairs), std::end(kCasePairs), cp,
        [](const CasePair& pair, char32_t value) { return pair.upper < value; });
    if (it != std::end(kCasePairs) && it->upper == cp) return it->lower;
    return cp;
}

std::string to_lower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        char32_t cp = 0;
        size_t len = decode_utf8(text, i, cp);
        if (len == 0) {
            out += text[i++];
            continue;
        }
        if (cp == 0x0130) {
            // Latin capital I with dot above lower-cases to two code points
            out += 'i';
            append_utf8(out, 0x0307);
        } else if (cp < 0x80) {
            out += static_cast<char>(to_lower(cp));
        } else {
            append_utf8(out, to_lower(cp));
        }
        i += len;
    }
    return out;
}

std::expected<std::string, ReadErrorInfo> read_text_file(const std::filesystem::path& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return std::unexpected(ReadErrorInfo{ReadError::NotFound, fmt::format("File not found: {}", path.string())});
    }
    if (!std::filesystem::is_regular_file(status)) {
        return std::unexpected(ReadErrorInfo{ReadError::NotAFile, fmt::format("Not a regular file: {}", path.string())});
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ReadErrorInfo{ReadError::IOError, fmt::format("Cannot read file: {}", path.string())});
    }
    std::string raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::unexpected(ReadErrorInfo{ReadError::IOError, fmt::format("Read failed: {}", path.string())});
    }
    return normalize_newlines(sanitize_utf8(raw));
}

} // namespace doclint
