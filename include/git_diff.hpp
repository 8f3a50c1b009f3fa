#pragma once

#include "changed_files.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <expected>

namespace doclint {

// Changed-file provider backed by the local git checkout. The change
// identifier is a revision range such as "origin/main...HEAD".
class GitDiffProvider : public ChangedFileProvider {
public:
    explicit GitDiffProvider(std::filesystem::path repo_path);

    std::expected<std::vector<std::string>, ProviderErrorInfo> changed_files(
        const std::string& change_id
    ) override;

    bool is_git_repo() const;

    // Quote for a POSIX shell
    static std::string shell_quote(std::string_view arg);

    // Paths from `git diff -z` output, NUL separated and unquoted
    static std::vector<std::string> split_nul(std::string_view output);

private:
    std::filesystem::path repo_path_;

    std::expected<std::string, ProviderErrorInfo> run_git_command(const std::string& args);
};

} // namespace doclint
