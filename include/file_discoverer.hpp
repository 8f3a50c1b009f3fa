#pragma once

#include "changed_files.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <expected>

namespace doclint {

struct DiscoveryConfig {
    std::filesystem::path root = "src";  // full-tree walk starts here, relative to repo_root
    std::filesystem::path repo_root = ".";
    std::vector<std::string> excluded_extensions = {".png", ".jpg", ".js", ".css"};
    std::vector<std::string> ignore_list = {"CHANGES.md"};
};

enum class DiscoveryError {
    RootNotFound,
    WalkFailed,
    ProviderFailed
};

struct DiscoveryErrorInfo {
    DiscoveryError error;
    std::string message;
};

class FileDiscoverer {
public:
    explicit FileDiscoverer(DiscoveryConfig config);

    // Every regular file under the root whose name does not end in an
    // excluded extension. Sorted, absolute.
    std::expected<std::vector<std::filesystem::path>, DiscoveryErrorInfo> discover_tree() const;

    // Paths reported by the provider, resolved against the repository
    // root. Only the ignore list applies in this mode.
    std::expected<std::vector<std::filesystem::path>, DiscoveryErrorInfo> discover_changed(
        ChangedFileProvider& provider,
        const std::string& change_id
    ) const;

    // Exact basename match against the ignore list
    bool is_ignored(const std::filesystem::path& path) const;

    // Case-sensitive suffix match of the file name
    bool is_excluded(const std::filesystem::path& path) const;

    const DiscoveryConfig& config() const { return config_; }

private:
    DiscoveryConfig config_;

    std::filesystem::path resolve(const std::filesystem::path& base, const std::filesystem::path& p) const;
};

} // namespace doclint
