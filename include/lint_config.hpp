#pragma once

#include "file_discoverer.hpp"
#include "github_client.hpp"
#include "pattern_set.hpp"
#include <string>
#include <string_view>
#include <filesystem>
#include <expected>

namespace doclint {

inline constexpr const char* kDefaultConfigName = ".doclint.json";

struct LintConfig {
    DiscoveryConfig discovery;
    PatternSet patterns = PatternSet::defaults();
    PullFileFilter pull_filter;
    size_t jobs = 1;
};

enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidValue
};

struct ConfigErrorInfo {
    ConfigError error;
    std::string message;
};

// Overlay a JSON document onto the config. Recognized keys: patterns,
// ignore, exclude_extensions, review_extensions (string arrays),
// path_prefix, root (strings) and jobs (positive integer). Keys that are
// present replace the current value; unknown keys are rejected.
std::expected<void, ConfigErrorInfo> apply_config_json(LintConfig& config, std::string_view text);

std::expected<void, ConfigErrorInfo> apply_config_file(LintConfig& config,
                                                       const std::filesystem::path& path);

// Environment variable value, or fallback when unset or empty
std::string env_or(const char* name, std::string fallback = {});

} // namespace doclint
