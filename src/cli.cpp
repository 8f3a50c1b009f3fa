#include "cli.hpp"
#include "github_client.hpp"
#include "git_diff.hpp"
#include "compact_log.hpp"
#include <fmt/format.h>
#include <charconv>
#include <chrono>
#include <filesystem>

namespace doclint {

namespace {

enum class FSMState {
    Init,
    ParseArgs,
    LoadConfig,
    RunLint,
    Report,
    Error,
    Done
};

struct FSMContext {
    const std::vector<std::string>& args;
    CliOptions options;
    LintConfig config;
    std::optional<LintOutcome> outcome;
    CliResult result;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
};

bool parse_jobs(std::string_view s, size_t& out) {
    size_t n = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc() || ptr != s.data() + s.size() || n == 0 || n > 256) return false;
    out = n;
    return true;
}

std::unexpected<CliErrorInfo> usage_error(std::string message) {
    return std::unexpected(CliErrorInfo{CliError::InvalidArguments, std::move(message)});
}

} // namespace

std::string usage_text(std::string_view program_name) {
    return fmt::format(
        "Documentation linter for Latin abbreviations\n\n"
        "Usage: {} [options]\n\n"
        "Without a change selector the whole scan root is checked.\n\n"
        "Change selectors (at most one):\n"
        "  --pull-request <n>      Files touched by GitHub pull request <n>\n"
        "  --git-diff <range>      Files in `git diff --name-only <range>`\n"
        "  --file-list <path|->    Newline-separated file list\n\n"
        "Options:\n"
        "  --root <dir>            Scan root, relative to the repo root (default: src)\n"
        "  --repo-root <dir>       Repository root (default: .)\n"
        "  --repo <owner/name>     GitHub repository (default: $GITHUB_REPOSITORY)\n"
        "  --config <file>         JSON config (default: <repo-root>/{} if present)\n"
        "  --jobs <n>              Scan with n threads (default: 1)\n"
        "  --format <text|json>    Report format (default: text)\n"
        "  --verbose               Diagnostics on stderr\n"
        "  --help                  Show this help\n\n"
        "Exit status: {} clean, {} violations found, {} internal failure\n",
        program_name, kDefaultConfigName, kExitPass, kExitViolations, kExitFailure);
}

std::expected<CliOptions, CliErrorInfo> parse_cli_args(const std::vector<std::string>& args) {
    CliOptions options;
    auto select = [&options](ChangeSource source, const std::string& value) -> bool {
        if (options.source != ChangeSource::None) return false;
        options.source = source;
        options.change_id = value;
        return true;
    };

    for (size_t i = 1; i < args.size(); ++i) {
        const auto& a = args[i];
        bool has_value = i + 1 < args.size();
        if (a == "--help" || a == "-h") {
            options.show_help = true;
        } else if (a == "--verbose" || a == "-v") {
            options.verbose = true;
        } else if ((a == "--pull-request" || a == "--git-diff" || a == "--file-list") && has_value) {
            auto source = a == "--pull-request" ? ChangeSource::PullRequest
                        : a == "--git-diff"     ? ChangeSource::GitDiff
                                                : ChangeSource::FileList;
            if (!select(source, args[++i])) {
                return usage_error("Only one of --pull-request, --git-diff, --file-list may be given");
            }
        } else if (a == "--root" && has_value) {
            options.root = args[++i];
        } else if (a == "--repo-root" && has_value) {
            options.repo_root = args[++i];
        } else if (a == "--repo" && has_value) {
            options.repo = args[++i];
        } else if (a == "--config" && has_value) {
            options.config_path = args[++i];
        } else if (a == "--format" && has_value) {
            auto format = parse_report_format(args[++i]);
            if (!format) return usage_error(fmt::format("Unknown report format: {}", args[i]));
            options.format = *format;
        } else if (a == "--jobs" && has_value) {
            size_t n = 0;
            if (!parse_jobs(args[++i], n)) return usage_error(fmt::format("Invalid --jobs value: {}", args[i]));
            options.jobs = n;
        } else {
            return usage_error(fmt::format("Unknown or incomplete argument: {}", a));
        }
    }
    return options;
}

std::expected<LintConfig, CliErrorInfo> load_lint_config(const CliOptions& options) {
    LintConfig config;
    config.discovery.repo_root = options.repo_root;

    std::filesystem::path config_path = options.config_path;
    if (config_path.empty()) {
        auto candidate = std::filesystem::path(options.repo_root) / kDefaultConfigName;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) config_path = candidate;
    }
    if (!config_path.empty()) {
        compact::Writer::debug(fmt::format("config {}", config_path.string()));
        auto applied = apply_config_file(config, config_path);
        if (!applied) return std::unexpected(CliErrorInfo{CliError::ConfigFailed, applied.error().message});
    }

    if (!options.root.empty()) config.discovery.root = options.root;
    if (options.jobs) config.jobs = *options.jobs;
    compact::Writer::debug(fmt::format("{} patterns, {} ignored names",
        config.patterns.size(), config.discovery.ignore_list.size()));
    return config;
}

std::unique_ptr<ChangedFileProvider> make_provider(const CliOptions& options, const LintConfig& config) {
    switch (options.source) {
        case ChangeSource::PullRequest: {
            auto repo = options.repo.empty() ? env_or("GITHUB_REPOSITORY") : options.repo;
            return std::make_unique<GitHubClient>(env_or("GITHUB_TOKEN"), repo, config.pull_filter);
        }
        case ChangeSource::GitDiff:
            return std::make_unique<GitDiffProvider>(options.repo_root);
        case ChangeSource::FileList:
            return std::make_unique<FileListProvider>();
        case ChangeSource::None:
            break;
    }
    return nullptr;
}

CliResult run_cli(const std::vector<std::string>& args) {
    FSMState state = FSMState::Init;
    FSMContext ctx{args};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                if (!env_or("DOCLINT_VERBOSE").empty()) compact::Writer::set_verbose(true);
                state = FSMState::ParseArgs;
                break;
            case FSMState::ParseArgs: {
                auto parsed = parse_cli_args(ctx.args);
                if (!parsed) {
                    ctx.result.exit_code = kExitFailure;
                    ctx.error_message = parsed.error().message;
                    state = FSMState::Error;
                    break;
                }
                ctx.options = std::move(*parsed);
                if (ctx.options.verbose) compact::Writer::set_verbose(true);
                if (ctx.options.show_help) {
                    ctx.result.output = usage_text(ctx.args.empty() ? "doclint" : ctx.args[0]);
                    state = FSMState::Done;
                } else {
                    state = FSMState::LoadConfig;
                }
                break;
            }
            case FSMState::LoadConfig: {
                auto config = load_lint_config(ctx.options);
                if (!config) {
                    ctx.result.exit_code = kExitFailure;
                    ctx.error_message = config.error().message;
                    state = FSMState::Error;
                    break;
                }
                ctx.config = std::move(*config);
                state = FSMState::RunLint;
                break;
            }
            case FSMState::RunLint: {
                LintRunner runner(ctx.config);
                if (auto provider = make_provider(ctx.options, ctx.config)) {
                    ctx.outcome = runner.run(*provider, ctx.options.change_id);
                } else {
                    ctx.outcome = runner.run();
                }
                state = FSMState::Report;
                break;
            }
            case FSMState::Report: {
                const auto& outcome = *ctx.outcome;
                ctx.result.exit_code = exit_code_for(outcome);
                if (!outcome) {
                    ctx.error_message = outcome.error().message;
                    state = FSMState::Error;
                    break;
                }
                if (!outcome->empty()) ctx.result.output = format_report(*outcome, ctx.options.format);
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - ctx.start_time).count();
                compact::Writer::debug(fmt::format("{} failing files, {} matches, {} ms",
                    outcome->size(), outcome->match_count(), ms));
                state = FSMState::Done;
                break;
            }
            case FSMState::Error:
                if (!ctx.error_message.empty()) ctx.result.errors += fmt::format("Error: {}\n", ctx.error_message);
                if (!ctx.outcome) ctx.result.errors += "Run with --help for usage.\n";
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.result;
}

} // namespace doclint
