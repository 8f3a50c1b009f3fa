#pragma once

#include "changed_files.hpp"
#include "http_client.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>

namespace doclint {

struct PullFile {
    std::string filename;
    std::string status;  // added, modified, removed, renamed, ...
};

struct PullFileFilter {
    std::string path_prefix = "src/";
    std::vector<std::string> extensions = {".md"};
};

// Changed-file provider backed by the GitHub pull request files API.
// The change identifier is a pull request number.
class GitHubClient : public ChangedFileProvider {
public:
    static constexpr int kPerPage = 100;
    static constexpr int kMaxPages = 30;  // GitHub stops listing at 3000 files
    static constexpr long kTimeoutSeconds = 30;

    GitHubClient(std::string token, std::string repository, PullFileFilter filter = {});

    std::expected<std::vector<std::string>, ProviderErrorInfo> changed_files(
        const std::string& change_id
    ) override;

    // Every file in the pull request, across all pages
    std::expected<std::vector<PullFile>, ProviderErrorInfo> list_pull_files(int pull_number);

    static std::expected<int, ProviderErrorInfo> parse_pull_number(std::string_view change_id);

    // One page of the /pulls/{n}/files response
    static std::expected<std::vector<PullFile>, ProviderErrorInfo> parse_files_page(std::string_view body);

    // Drops removed files and anything outside the prefix or extensions
    static std::vector<std::string> filter_files(const std::vector<PullFile>& files,
                                                 const PullFileFilter& filter);

    static bool valid_repository(std::string_view repository);

    // URL of the rel="next" entry of a Link header. Only API URLs are
    // followed, so the token is never sent to another host.
    static std::optional<std::string> next_page_url(std::string_view link_header);

private:
    std::string token_;
    std::string repository_;
    PullFileFilter filter_;
    HttpClient http_client_;

    std::string get_api_url(int pull_number) const;
};

} // namespace doclint
