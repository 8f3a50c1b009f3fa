#include "lint_config.hpp"
#include "temp_tree.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace doclint;

int main() {
    LintConfig config;
    assert(config.patterns.size() == 8);
    assert(config.discovery.root == "src");
    assert((config.discovery.ignore_list == std::vector<std::string>{"CHANGES.md"}));
    assert(config.pull_filter.path_prefix == "src/");
    assert(config.jobs == 1);
    std::cout << "✓ Defaults\n";

    auto applied = apply_config_json(config, R"({
        "patterns": ["Viz.", "N.B."],
        "ignore": ["CHANGES.md", "CODE_OF_CONDUCT.md"],
        "exclude_extensions": [".svg"],
        "review_extensions": [".md", ".rst"],
        "path_prefix": "docs/",
        "root": "docs",
        "jobs": 4
    })");
    assert(applied);
    assert((config.patterns.patterns() == std::vector<std::string>{"viz.", "n.b."}));
    assert(config.discovery.ignore_list.size() == 2);
    assert((config.discovery.excluded_extensions == std::vector<std::string>{".svg"}));
    assert(config.pull_filter.extensions.size() == 2);
    assert(config.pull_filter.path_prefix == "docs/");
    assert(config.discovery.root == "docs");
    assert(config.jobs == 4);
    std::cout << "✓ Config keys applied\n";

    LintConfig partial;
    assert(apply_config_json(partial, R"({"ignore": []})"));
    assert(partial.discovery.ignore_list.empty());
    assert(partial.patterns.size() == 8);
    std::cout << "✓ Absent keys keep defaults\n";

    const char* rejected[] = {
        "not json",
        "[]",
        R"({"patterns": "e.g."})",
        R"({"patterns": ["ok", ""]})",
        R"({"ignore": [1]})",
        R"({"root": 5})",
        R"({"jobs": 0})",
        R"({"jobs": 1.5})",
        R"({"colour": "blue"})",
    };
    for (const char* text : rejected) {
        LintConfig c;
        auto r = apply_config_json(c, text);
        assert(!r);
        assert(c.patterns.size() == 8 && c.discovery.root == "src");
    }
    LintConfig c;
    assert(apply_config_json(c, "{oops").error().error == ConfigError::ParseError);
    assert(apply_config_json(c, R"({"x": 1})").error().error == ConfigError::InvalidValue);
    std::cout << "✓ Bad config rejected without partial updates\n";

    TempTree tree("config");
    auto path = tree.write(".doclint.json", R"({"patterns": ["etc."]})");
    LintConfig from_file;
    assert(apply_config_file(from_file, path));
    assert(from_file.patterns.patterns().front() == "etc.");
    auto missing = apply_config_file(from_file, tree.root() / "absent.json");
    assert(!missing && missing.error().error == ConfigError::FileNotFound);
    auto broken = tree.write("broken.json", "{");
    auto bad = apply_config_file(from_file, broken);
    assert(!bad && bad.error().message.find("broken.json") != std::string::npos);
    std::cout << "✓ Config files\n";

    ::setenv("DOCLINT_TEST_VAR", "value", 1);
    assert(env_or("DOCLINT_TEST_VAR") == "value");
    ::setenv("DOCLINT_TEST_VAR", "", 1);
    assert(env_or("DOCLINT_TEST_VAR", "fallback") == "fallback");
    ::unsetenv("DOCLINT_TEST_VAR");
    assert(env_or("DOCLINT_TEST_VAR").empty());
    std::cout << "✓ Environment lookup\n";
    return 0;
}
