#include "lint_config.hpp"
#include "json.hpp"
#include <fmt/format.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>

namespace doclint {

static std::unexpected<ConfigErrorInfo> invalid(const std::string& key, const std::string& what) {
    return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue, fmt::format("Config key '{}' {}", key, what)});
}

static std::expected<std::vector<std::string>, ConfigErrorInfo> string_list(const json::Value& value,
                                                                           const std::string& key) {
    if (!value.is_array()) return invalid(key, "must be an array of strings");
    std::vector<std::string> out;
    for (const auto& item : value.as_array()) {
        if (!item.is_string()) return invalid(key, "must be an array of strings");
        out.push_back(item.as_string());
    }
    return out;
}

static std::expected<std::string, ConfigErrorInfo> string_value(const json::Value& value,
                                                               const std::string& key) {
    if (!value.is_string()) return invalid(key, "must be a string");
    return value.as_string();
}

std::expected<void, ConfigErrorInfo> apply_config_json(LintConfig& config, std::string_view text) {
    json::Value doc;
    try {
        doc = json::parse(text);
    } catch (const json::ParseError& e) {
        return std::unexpected(ConfigErrorInfo{ConfigError::ParseError, e.what()});
    }
    if (!doc.is_object()) {
        return std::unexpected(ConfigErrorInfo{ConfigError::ParseError, "Config must be a JSON object"});
    }

    // Validate everything before touching the caller's config
    LintConfig next = config;
    for (const auto& [key, value] : doc.as_object()) {
        if (key == "patterns") {
            auto list = string_list(value, key);
            if (!list) return std::unexpected(list.error());
            auto set = PatternSet::from_list(*list);
            if (!set) return invalid(key, fmt::format("is invalid: {}", set.error().message));
            next.patterns = std::move(*set);
        } else if (key == "ignore") {
            auto list = string_list(value, key);
            if (!list) return std::unexpected(list.error());
            next.discovery.ignore_list = std::move(*list);
        } else if (key == "exclude_extensions") {
            auto list = string_list(value, key);
            if (!list) return std::unexpected(list.error());
            next.discovery.excluded_extensions = std::move(*list);
        } else if (key == "review_extensions") {
            auto list = string_list(value, key);
            if (!list) return std::unexpected(list.error());
            next.pull_filter.extensions = std::move(*list);
        } else if (key == "path_prefix") {
            auto s = string_value(value, key);
            if (!s) return std::unexpected(s.error());
            next.pull_filter.path_prefix = std::move(*s);
        } else if (key == "root") {
            auto s = string_value(value, key);
            if (!s) return std::unexpected(s.error());
            if (s->empty()) return invalid(key, "must not be empty");
            next.discovery.root = std::move(*s);
        } else if (key == "jobs") {
            if (!value.is_number()) return invalid(key, "must be a number");
            double n = value.as_number();
            if (n < 1 || n > 256 || std::floor(n) != n) return invalid(key, "must be an integer in [1, 256]");
            next.jobs = static_cast<size_t>(n);
        } else {
            return std::unexpected(ConfigErrorInfo{ConfigError::InvalidValue, fmt::format("Unknown config key '{}'", key)});
        }
    }
    config = std::move(next);
    return {};
}

std::expected<void, ConfigErrorInfo> apply_config_file(LintConfig& config, const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(ConfigErrorInfo{ConfigError::FileNotFound, fmt::format("Cannot open config file: {}", path.string())});
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto applied = apply_config_json(config, text);
    if (!applied) {
        auto err = applied.error();
        err.message = fmt::format("{}: {}", path.string(), err.message);
        return std::unexpected(err);
    }
    return {};
}

std::string env_or(const char* name, std::string fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return fallback;
    return value;
}

} // namespace doclint
