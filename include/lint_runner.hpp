#pragma once

#include "changed_files.hpp"
#include "lint_config.hpp"
#include "reporter.hpp"
#include "scanner.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <expected>

namespace doclint {

enum class LintError {
    DiscoveryFailed,
    ChangeLookupFailed
};

struct LintErrorInfo {
    LintError error;
    std::string message;
};

// Value with an empty report: pass. Value with entries: violations.
// Error: the run itself failed and nothing was scanned.
using LintOutcome = std::expected<Report, LintErrorInfo>;

inline constexpr int kExitPass = 0;
inline constexpr int kExitViolations = 1;
inline constexpr int kExitFailure = 2;

int exit_code_for(const LintOutcome& outcome);

class LintRunner {
public:
    explicit LintRunner(LintConfig config);

    // Full-tree run under the configured root
    LintOutcome run() const;

    // Changed-file run; the provider is asked once, before any scanning
    LintOutcome run(ChangedFileProvider& provider, const std::string& change_id) const;

    // Scan every file and collect the ones with matches. Never stops early.
    Report scan_all(const std::vector<std::filesystem::path>& files) const;

    const LintConfig& config() const { return config_; }

private:
    LintConfig config_;
    FileDiscoverer discoverer_;
    Scanner scanner_;
};

} // namespace doclint
