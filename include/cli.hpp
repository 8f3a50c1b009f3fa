#pragma once

#include "changed_files.hpp"
#include "lint_config.hpp"
#include "lint_runner.hpp"
#include "reporter.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <optional>
#include <expected>

namespace doclint {

enum class ChangeSource {
    None,
    PullRequest,
    GitDiff,
    FileList
};

struct CliOptions {
    ChangeSource source = ChangeSource::None;
    std::string change_id;
    std::string root;                 // empty: keep the configured root
    std::string repo_root = ".";
    std::string repo;                 // empty: $GITHUB_REPOSITORY
    std::string config_path;          // empty: <repo_root>/.doclint.json if present
    ReportFormat format = ReportFormat::Text;
    std::optional<size_t> jobs;
    bool show_help = false;
    bool verbose = false;
};

enum class CliError {
    InvalidArguments,
    ConfigFailed
};

struct CliErrorInfo {
    CliError error;
    std::string message;
};

// What one invocation printed and how it ended. Output belongs on stdout,
// errors on stderr.
struct CliResult {
    int exit_code = kExitPass;
    std::string output;
    std::string errors;
};

// args[0] is the program name
std::expected<CliOptions, CliErrorInfo> parse_cli_args(const std::vector<std::string>& args);

// Defaults, then the config file, then --root / --jobs
std::expected<LintConfig, CliErrorInfo> load_lint_config(const CliOptions& options);

// nullptr when no change selector was given
std::unique_ptr<ChangedFileProvider> make_provider(const CliOptions& options, const LintConfig& config);

std::string usage_text(std::string_view program_name);

CliResult run_cli(const std::vector<std::string>& args);

} // namespace doclint
