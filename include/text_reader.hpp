#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <expected>

namespace doclint {

enum class ReadError {
    NotFound,
    NotAFile,
    IOError
};

struct ReadErrorInfo {
    ReadError error;
    std::string message;
};

// Read a file as text: ill-formed UTF-8 bytes are dropped and CRLF / CR
// line endings become LF.
std::expected<std::string, ReadErrorInfo> read_text_file(const std::filesystem::path& path);

// Drop every byte that is not part of a well-formed UTF-8 sequence.
// Truncated sequences lose their lead byte and valid continuation prefix;
// scanning resumes at the first offending byte.
std::string sanitize_utf8(std::string_view bytes);

std::string normalize_newlines(std::string_view text);

// Unicode simple lower-case mapping of one code point
char32_t to_lower(char32_t cp);

// Lower-case UTF-8 text code point by code point. Bytes that are not
// well-formed UTF-8 pass through unchanged.
std::string to_lower(std::string_view text);

} // namespace doclint
