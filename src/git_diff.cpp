#include "git_diff.hpp"
#include "compact_log.hpp"
#include <fmt/format.h>
#include <cstdio>
#include <array>
#include <memory>
#include <fstream>
#include <iterator>
#include <cstdlib>
#include <unistd.h>
#include <sys/wait.h>

namespace doclint {

GitDiffProvider::GitDiffProvider(std::filesystem::path repo_path)
    : repo_path_(std::move(repo_path)) {}

bool GitDiffProvider::is_git_repo() const {
    std::error_code ec;
    return std::filesystem::exists(repo_path_ / ".git", ec);
}

std::string GitDiffProvider::shell_quote(std::string_view arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::vector<std::string> GitDiffProvider::split_nul(std::string_view output) {
    std::vector<std::string> paths;
    while (!output.empty()) {
        auto end = output.find('\0');
        auto path = output.substr(0, end);
        if (!path.empty()) paths.emplace_back(path);
        if (end == std::string_view::npos) break;
        output.remove_prefix(end + 1);
    }
    return paths;
}

std::expected<std::string, ProviderErrorInfo> GitDiffProvider::run_git_command(const std::string& args) {
    // stderr goes to its own file so diagnostics never mix into parsed output
    std::error_code tmp_ec;
    auto tmp_dir = std::filesystem::temp_directory_path(tmp_ec);
    if (tmp_ec) tmp_dir = "/tmp";
    std::string err_path = (tmp_dir / "doclint-git-XXXXXX").string();
    int err_fd = mkstemp(err_path.data());
    if (err_fd == -1) {
        return std::unexpected(ProviderErrorInfo{ProviderError::IOError, "Failed to create a temporary file for git"});
    }
    close(err_fd);

    auto cmd = fmt::format("git -C {} -c core.quotePath=false {} 2>{}",
        shell_quote(repo_path_.string()), args, shell_quote(err_path));
    compact::Writer::debug(fmt::format("run {}", cmd));
    std::array<char, 4096> buffer;
    std::string result;

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) {
        std::error_code ec;
        std::filesystem::remove(err_path, ec);
        return std::unexpected(ProviderErrorInfo{ProviderError::CommandFailed, "Failed to execute git"});
    }

    size_t n = 0;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
        result.append(buffer.data(), n);
    }

    int status = pclose(pipe.release());

    std::string diagnostics;
    {
        std::ifstream err_file(err_path, std::ios::binary);
        diagnostics.assign(std::istreambuf_iterator<char>(err_file), std::istreambuf_iterator<char>());
    }
    std::error_code ec;
    std::filesystem::remove(err_path, ec);

    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        while (!diagnostics.empty() && (diagnostics.back() == '\n' || diagnostics.back() == '\r')) {
            diagnostics.pop_back();
        }
        return std::unexpected(ProviderErrorInfo{ProviderError::CommandFailed,
            fmt::format("git {} failed: {}", args, diagnostics)});
    }
    return result;
}

std::expected<std::vector<std::string>, ProviderErrorInfo> GitDiffProvider::changed_files(
    const std::string& change_id
) {
    if (change_id.empty() || change_id.starts_with('-')) {
        return std::unexpected(ProviderErrorInfo{ProviderError::InvalidChangeId,
            fmt::format("Invalid revision range: '{}'", change_id)});
    }
    if (!is_git_repo()) {
        return std::unexpected(ProviderErrorInfo{ProviderError::NotFound,
            fmt::format("Not a git repository: {}", repo_path_.string())});
    }

    auto output = run_git_command(fmt::format("diff --name-only -z {} --", shell_quote(change_id)));
    if (!output) return std::unexpected(output.error());
    return split_nul(*output);
}

} // namespace doclint
