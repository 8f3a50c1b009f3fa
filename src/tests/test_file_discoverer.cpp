#include "file_discoverer.hpp"
#include "temp_tree.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace doclint;

class CannedProvider : public ChangedFileProvider {
public:
    std::vector<std::string> files;
    bool fail = false;
    int calls = 0;
    std::string last_id;

    std::expected<std::vector<std::string>, ProviderErrorInfo> changed_files(
        const std::string& change_id
    ) override {
        ++calls;
        last_id = change_id;
        if (fail) return std::unexpected(ProviderErrorInfo{ProviderError::NetworkError, "offline"});
        return files;
    }
};

static bool contains(const std::vector<std::filesystem::path>& v, const std::filesystem::path& p) {
    return std::find(v.begin(), v.end(), p) != v.end();
}

int main() {
    TempTree tree("discoverer");
    auto guide = tree.write("src/guide.md", "text");
    auto nested = tree.write("src/a/b/deep.txt", "text");
    auto noext = tree.write("src/README", "text");
    tree.write("src/logo.png", "bin");
    tree.write("src/photo.jpg", "bin");
    tree.write("src/app.min.js", "code");
    tree.write("src/style.css", "code");
    tree.write("src/a/CHANGES.md", "e.g. changelog");
    auto upper = tree.write("src/LOGO.PNG", "bin");
    tree.write("outside.md", "not under root");

    DiscoveryConfig config;
    config.repo_root = tree.root();
    FileDiscoverer discoverer(config);

    auto files = discoverer.discover_tree();
    assert(files);
    assert(files->size() == 4);
    assert(contains(*files, guide) && contains(*files, nested) && contains(*files, noext));
    assert(contains(*files, upper));  // suffix match is case-sensitive
    assert(std::is_sorted(files->begin(), files->end()));
    std::cout << "✓ Tree walk excludes extensions and ignored names\n";

    assert(discoverer.is_ignored("docs/CHANGES.md"));
    assert(!discoverer.is_ignored("docs/CHANGES.md.bak"));
    assert(!discoverer.is_ignored("docs/changes.md"));
    assert(discoverer.is_excluded("x/y.css"));
    assert(!discoverer.is_excluded("x/y.cssx"));
    std::cout << "✓ Ignore list is exact basename\n";

    DiscoveryConfig missing_root = config;
    missing_root.root = "nope";
    auto missing = FileDiscoverer(missing_root).discover_tree();
    assert(!missing && missing.error().error == DiscoveryError::RootNotFound);
    std::cout << "✓ Missing root is an error\n";

    CannedProvider provider;
    provider.files = {"src/guide.md", "docs/CHANGES.md", "src/logo.png", "src/removed.md", "/abs/path.md"};
    auto changed = discoverer.discover_changed(provider, "42");
    assert(changed);
    assert(provider.calls == 1 && provider.last_id == "42");
    assert(changed->size() == 4);
    assert((*changed)[0] == guide);
    assert((*changed)[1] == tree.root() / "src/logo.png");  // no extension filter here
    assert((*changed)[2] == tree.root() / "src/removed.md");
    assert((*changed)[3] == std::filesystem::path("/abs/path.md"));
    std::cout << "✓ Changed files resolved, only ignore list applied\n";

    provider.files.clear();
    auto none = discoverer.discover_changed(provider, "7");
    assert(none && none->empty());

    provider.fail = true;
    auto failed = discoverer.discover_changed(provider, "7");
    assert(!failed && failed.error().error == DiscoveryError::ProviderFailed);
    assert(failed.error().message.find("offline") != std::string::npos);
    std::cout << "✓ Provider errors propagate\n";
    return 0;
}
