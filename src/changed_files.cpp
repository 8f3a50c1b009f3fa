#include "changed_files.hpp"
#include <fmt/format.h>
#include <fstream>
#include <iostream>

namespace doclint {

const char* to_string(ProviderError error) {
    switch (error) {
        case ProviderError::InvalidChangeId: return "invalid change id";
        case ProviderError::NotFound: return "not found";
        case ProviderError::AuthRequired: return "authentication required";
        case ProviderError::NetworkError: return "network error";
        case ProviderError::ParseError: return "parse error";
        case ProviderError::CommandFailed: return "command failed";
        case ProviderError::IOError: return "I/O error";
    }
    return "unknown error";
}

static std::vector<std::string> read_path_lines(std::istream& in) {
    std::vector<std::string> paths;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        auto last = line.find_last_not_of(" \t");
        paths.push_back(line.substr(first, last - first + 1));
    }
    return paths;
}

std::expected<std::vector<std::string>, ProviderErrorInfo> FileListProvider::changed_files(
    const std::string& change_id
) {
    if (change_id.empty()) {
        return std::unexpected(ProviderErrorInfo{ProviderError::InvalidChangeId, "No file list given"});
    }
    if (change_id == "-") {
        auto paths = read_path_lines(std::cin);
        if (std::cin.bad()) {
            return std::unexpected(ProviderErrorInfo{ProviderError::IOError, "Failed reading file list from stdin"});
        }
        return paths;
    }

    std::ifstream file(change_id);
    if (!file) {
        return std::unexpected(ProviderErrorInfo{ProviderError::NotFound, fmt::format("Cannot open file list: {}", change_id)});
    }
    auto paths = read_path_lines(file);
    if (file.bad()) {
        return std::unexpected(ProviderErrorInfo{ProviderError::IOError, fmt::format("Failed reading file list: {}", change_id)});
    }
    return paths;
}

} // namespace doclint
