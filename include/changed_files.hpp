#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <expected>

namespace doclint {

enum class ProviderError {
    InvalidChangeId,
    NotFound,
    AuthRequired,
    NetworkError,
    ParseError,
    CommandFailed,
    IOError
};

struct ProviderErrorInfo {
    ProviderError error;
    std::string message;
};

const char* to_string(ProviderError error);

// Resolves a change identifier (pull request number, revision range, ...)
// to the paths that change touches. Any error aborts the run.
class ChangedFileProvider {
public:
    virtual ~ChangedFileProvider() = default;

    virtual std::expected<std::vector<std::string>, ProviderErrorInfo> changed_files(
        const std::string& change_id
    ) = 0;
};

// Newline-separated path list read from a file, or stdin for "-".
// The change identifier names the list.
class FileListProvider : public ChangedFileProvider {
public:
    std::expected<std::vector<std::string>, ProviderErrorInfo> changed_files(
        const std::string& change_id
    ) override;
};

// Fixed answer, for embedding the runner in other tools
class StaticFileProvider : public ChangedFileProvider {
public:
    explicit StaticFileProvider(std::vector<std::string> files) : files_(std::move(files)) {}

    std::expected<std::vector<std::string>, ProviderErrorInfo> changed_files(
        const std::string& /*change_id*/
    ) override {
        return files_;
    }

private:
    std::vector<std::string> files_;
};

} // namespace doclint
