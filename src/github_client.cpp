#include "github_client.hpp"
#include "compact_log.hpp"
#include "json.hpp"
#include <fmt/format.h>
#include <charconv>
#include <iterator>

namespace doclint {

GitHubClient::GitHubClient(std::string token, std::string repository, PullFileFilter filter)
    : token_(std::move(token)), repository_(std::move(repository)), filter_(std::move(filter)) {
    http_client_.set_timeout(kTimeoutSeconds);
    http_client_.set_header("Accept", "application/vnd.github+json");
    http_client_.set_header("X-GitHub-Api-Version", "2022-11-28");
    if (!token_.empty()) {
        http_client_.set_header("Authorization", "Bearer " + token_);
    }
}

static constexpr std::string_view kApiBase = "https://api.github.com/";

std::string GitHubClient::get_api_url(int pull_number) const {
    return fmt::format("{}repos/{}/pulls/{}/files?per_page={}", kApiBase, repository_, pull_number, kPerPage);
}

std::optional<std::string> GitHubClient::next_page_url(std::string_view link_header) {
    // <https://...?page=2>; rel="next", <https://...?page=5>; rel="last"
    while (!link_header.empty()) {
        auto comma = link_header.find(',');
        auto entry = link_header.substr(0, comma);
        link_header = comma == std::string_view::npos ? std::string_view{} : link_header.substr(comma + 1);

        auto open = entry.find('<');
        auto close = entry.find('>', open);
        if (open == std::string_view::npos || close == std::string_view::npos) continue;
        auto params = entry.substr(close + 1);
        if (params.find("rel=\"next\"") == std::string_view::npos) continue;
        auto url = entry.substr(open + 1, close - open - 1);
        if (!url.starts_with(kApiBase)) return std::nullopt;
        return std::string(url);
    }
    return std::nullopt;
}

bool GitHubClient::valid_repository(std::string_view repository) {
    auto slash = repository.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 == repository.size()) return false;
    return repository.find('/', slash + 1) == std::string_view::npos;
}

std::expected<int, ProviderErrorInfo> GitHubClient::parse_pull_number(std::string_view change_id) {
    if (change_id.starts_with('#')) change_id.remove_prefix(1);
    int number = 0;
    auto [ptr, ec] = std::from_chars(change_id.data(), change_id.data() + change_id.size(), number);
    if (change_id.empty() || ec != std::errc() || ptr != change_id.data() + change_id.size() || number <= 0) {
        return std::unexpected(ProviderErrorInfo{ProviderError::InvalidChangeId,
            fmt::format("Invalid pull request number: '{}'", change_id)});
    }
    return number;
}

std::expected<std::vector<PullFile>, ProviderErrorInfo> GitHubClient::parse_files_page(std::string_view body) {
    json::Value doc;
    try {
        doc = json::parse(body);
    } catch (const json::ParseError& e) {
        return std::unexpected(ProviderErrorInfo{ProviderError::ParseError,
            fmt::format("Malformed pull request file list: {}", e.what())});
    }
    if (!doc.is_array()) {
        std::string detail = doc["message"].is_string() ? doc["message"].as_string() : "expected a JSON array";
        return std::unexpected(ProviderErrorInfo{ProviderError::ParseError,
            fmt::format("Unexpected pull request file list: {}", detail)});
    }

    std::vector<PullFile> files;
    for (const auto& entry : doc.as_array()) {
        if (!entry["filename"].is_string()) {
            return std::unexpected(ProviderErrorInfo{ProviderError::ParseError,
                "Pull request file entry without a filename"});
        }
        PullFile f;
        f.filename = entry["filename"].as_string();
        if (entry["status"].is_string()) f.status = entry["status"].as_string();
        files.push_back(std::move(f));
    }
    return files;
}

std::vector<std::string> GitHubClient::filter_files(const std::vector<PullFile>& files,
                                                    const PullFileFilter& filter) {
    std::vector<std::string> kept;
    for (const auto& f : files) {
        if (f.status == "removed") continue;
        if (!f.filename.starts_with(filter.path_prefix)) continue;
        if (!filter.extensions.empty()) {
            bool wanted = false;
            for (const auto& ext : filter.extensions) {
                if (f.filename.ends_with(ext)) { wanted = true; break; }
            }
            if (!wanted) continue;
        }
        kept.push_back(f.filename);
    }
    return kept;
}

std::expected<std::vector<PullFile>, ProviderErrorInfo> GitHubClient::list_pull_files(int pull_number) {
    if (!valid_repository(repository_)) {
        return std::unexpected(ProviderErrorInfo{ProviderError::InvalidChangeId,
            fmt::format("Repository must be OWNER/NAME (use --repo or GITHUB_REPOSITORY), got '{}'", repository_)});
    }

    std::vector<PullFile> all;
    std::string url = get_api_url(pull_number);
    for (int page = 1; page <= kMaxPages; ++page) {
        auto response = http_client_.get_full(url);
        if (!response) return std::unexpected(ProviderErrorInfo{ProviderError::NetworkError, response.error().message});

        int status = response->status_code;
        if (status == 404) {
            return std::unexpected(ProviderErrorInfo{ProviderError::NotFound,
                fmt::format("Pull request #{} not found in {}", pull_number, repository_)});
        }
        if (status == 401 || status == 403) {
            auto remaining = response->headers.find("x-ratelimit-remaining");
            bool rate_limited = remaining != response->headers.end() && remaining->second == "0";
            return std::unexpected(ProviderErrorInfo{ProviderError::AuthRequired,
                fmt::format("GitHub refused the request (HTTP {}{}). Set GITHUB_TOKEN",
                    status, rate_limited ? ", rate limit exhausted" : "")});
        }
        if (status >= 400) {
            return std::unexpected(ProviderErrorInfo{ProviderError::NetworkError, fmt::format("HTTP Error {}", status)});
        }

        auto files = parse_files_page(response->body);
        if (!files) return std::unexpected(files.error());
        all.insert(all.end(), std::make_move_iterator(files->begin()), std::make_move_iterator(files->end()));

        auto link = response->headers.find("link");
        std::optional<std::string> next;
        if (link != response->headers.end()) next = next_page_url(link->second);
        if (!next) break;
        url = std::move(*next);
    }
    compact::Writer::debug(fmt::format("pull request #{} touches {} files", pull_number, all.size()));
    return all;
}

std::expected<std::vector<std::string>, ProviderErrorInfo> GitHubClient::changed_files(
    const std::string& change_id
) {
    auto number = parse_pull_number(change_id);
    if (!number) return std::unexpected(number.error());
    auto files = list_pull_files(*number);
    if (!files) return std::unexpected(files.error());
    return filter_files(*files, filter_);
}

} // namespace doclint
