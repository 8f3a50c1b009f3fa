#include "file_discoverer.hpp"
#include "compact_log.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace doclint {

FileDiscoverer::FileDiscoverer(DiscoveryConfig config) : config_(std::move(config)) {}

bool FileDiscoverer::is_ignored(const std::filesystem::path& path) const {
    auto name = path.filename().string();
    return std::find(config_.ignore_list.begin(), config_.ignore_list.end(), name) != config_.ignore_list.end();
}

bool FileDiscoverer::is_excluded(const std::filesystem::path& path) const {
    auto name = path.filename().string();
    return std::ranges::any_of(config_.excluded_extensions, [&](const std::string& ext) {
        return name.ends_with(ext);
    });
}

std::filesystem::path FileDiscoverer::resolve(const std::filesystem::path& base,
                                              const std::filesystem::path& p) const {
    auto joined = p.is_absolute() ? p : base / p;
    std::error_code ec;
    auto abs = std::filesystem::absolute(joined, ec);
    return (ec ? joined : abs).lexically_normal();
}

std::expected<std::vector<std::filesystem::path>, DiscoveryErrorInfo> FileDiscoverer::discover_tree() const {
    auto root = resolve(config_.repo_root, config_.root);
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return std::unexpected(DiscoveryErrorInfo{DiscoveryError::RootNotFound,
            fmt::format("Scan root is not a directory: {}", root.string())});
    }

    std::vector<std::filesystem::path> files;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(DiscoveryErrorInfo{DiscoveryError::WalkFailed,
            fmt::format("Cannot walk {}: {}", root.string(), ec.message())});
    }

    const auto end = std::filesystem::recursive_directory_iterator();
    while (it != end) {
        std::error_code type_ec;
        const auto& path = it->path();
        if (it->is_regular_file(type_ec) && !is_excluded(path)) {
            if (is_ignored(path)) {
                compact::Writer::debug(fmt::format("ignore {}", path.string()));
            } else {
                files.push_back(path.lexically_normal());
            }
        }
        it.increment(ec);
        if (ec) {
            return std::unexpected(DiscoveryErrorInfo{DiscoveryError::WalkFailed,
                fmt::format("Walk of {} stopped: {}", root.string(), ec.message())});
        }
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    compact::Writer::debug(fmt::format("discovered {} files under {}", files.size(), root.string()));
    return files;
}

std::expected<std::vector<std::filesystem::path>, DiscoveryErrorInfo> FileDiscoverer::discover_changed(
    ChangedFileProvider& provider,
    const std::string& change_id
) const {
    auto changed = provider.changed_files(change_id);
    if (!changed) {
        return std::unexpected(DiscoveryErrorInfo{DiscoveryError::ProviderFailed,
            fmt::format("Changed-file lookup failed ({}): {}", to_string(changed.error().error),
                changed.error().message)});
    }

    std::vector<std::filesystem::path> files;
    files.reserve(changed->size());
    for (const auto& entry : *changed) {
        std::filesystem::path p(entry);
        if (is_ignored(p)) {
            compact::Writer::debug(fmt::format("ignore {}", entry));
            continue;
        }
        files.push_back(resolve(config_.repo_root, p));
    }
    compact::Writer::debug(fmt::format("change {} yields {} files", change_id, files.size()));
    return files;
}

} // namespace doclint
