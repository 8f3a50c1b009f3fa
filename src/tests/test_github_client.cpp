#include "github_client.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace doclint;

// Trimmed GET /repos/{owner}/{repo}/pulls/{n}/files response
static const char* kFilesPage = R"([
  {"sha": "bbcd538c8e72b8c175046e27cc8f907076331401", "filename": "src/guide/intro.md",
   "status": "modified", "additions": 3, "deletions": 1, "changes": 4},
  {"sha": "0d1f4b5b", "filename": "src/guide/old.md", "status": "removed"},
  {"sha": "77aa", "filename": "src/figures/plot.png", "status": "added"},
  {"sha": "1234", "filename": "README.md", "status": "modified"},
  {"sha": "5678", "filename": "src/notes/new.md", "status": "renamed",
   "previous_filename": "src/notes/draft.md"}
])";

int main() {
    auto page = GitHubClient::parse_files_page(kFilesPage);
    assert(page);
    assert(page->size() == 5);
    assert((*page)[0].filename == "src/guide/intro.md" && (*page)[0].status == "modified");
    assert((*page)[1].status == "removed");
    std::cout << "✓ Files page parsed\n";

    auto kept = GitHubClient::filter_files(*page, PullFileFilter{});
    assert((kept == std::vector<std::string>{"src/guide/intro.md", "src/notes/new.md"}));

    PullFileFilter everything{"", {}};
    auto all = GitHubClient::filter_files(*page, everything);
    assert(all.size() == 4);  // only the removed file is dropped
    std::cout << "✓ Removed, out-of-tree and non-doc files filtered\n";

    assert(GitHubClient::parse_files_page("[]")->empty());
    auto api_error = GitHubClient::parse_files_page(R"({"message": "Not Found"})");
    assert(!api_error && api_error.error().error == ProviderError::ParseError);
    assert(api_error.error().message.find("Not Found") != std::string::npos);
    assert(!GitHubClient::parse_files_page("<html>"));
    assert(!GitHubClient::parse_files_page(R"([{"status": "added"}])"));
    std::cout << "✓ Unusable responses are errors\n";

    assert(*GitHubClient::parse_pull_number("123") == 123);
    assert(*GitHubClient::parse_pull_number("#9") == 9);
    for (const char* bad : {"", "#", "0", "-4", "12a", "abc", " 1"}) {
        auto n = GitHubClient::parse_pull_number(bad);
        assert(!n && n.error().error == ProviderError::InvalidChangeId);
    }
    std::cout << "✓ Pull request numbers validated\n";

    const std::string base = "https://api.github.com/repositories/1/pulls/2/files?per_page=100";
    auto next = GitHubClient::next_page_url(
        "<" + base + "&page=2>; rel=\"next\", <" + base + "&page=7>; rel=\"last\"");
    assert(next && *next == base + "&page=2");
    auto middle = GitHubClient::next_page_url(
        "<" + base + "&page=1>; rel=\"prev\", <" + base + "&page=3>; rel=\"next\"");
    assert(middle && *middle == base + "&page=3");
    assert(!GitHubClient::next_page_url("<" + base + "&page=1>; rel=\"first\", <" + base + "&page=6>; rel=\"prev\""));
    assert(!GitHubClient::next_page_url(""));
    assert(!GitHubClient::next_page_url("<https://example.com/steal?page=2>; rel=\"next\""));
    std::cout << "✓ Link header pagination\n";

    assert(GitHubClient::valid_repository("owner/name"));
    assert(!GitHubClient::valid_repository("owner"));
    assert(!GitHubClient::valid_repository("/name"));
    assert(!GitHubClient::valid_repository("owner/"));
    assert(!GitHubClient::valid_repository("a/b/c"));

    // Rejected before any request is made
    GitHubClient client("", "not-a-slug");
    auto files = client.changed_files("5");
    assert(!files && files.error().error == ProviderError::InvalidChangeId);
    auto bad_id = client.changed_files("five");
    assert(!bad_id && bad_id.error().error == ProviderError::InvalidChangeId);
    std::cout << "✓ Repository slug validated offline\n";
    return 0;
}
