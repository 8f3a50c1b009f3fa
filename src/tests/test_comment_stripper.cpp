#include "comment_stripper.hpp"
#include <cassert>
#include <iostream>
#include <string>

using namespace doclint;

int main() {
    assert(strip_comments("") == "");
    assert(strip_comments("no comments here") == "no comments here");
    std::cout << "✓ Text without comments is unchanged\n";

    assert(strip_comments("a <!-- x --> b") == "a  b");
    assert(strip_comments("<!-- x -->") == "");
    assert(strip_comments("one <!-- a --> two <!-- b --> three") == "one  two  three");
    std::cout << "✓ Single-line spans removed\n";

    assert(strip_comments("keep\n<!-- first\nsecond\nthird -->\ntail") == "keep\n\ntail");
    std::cout << "✓ Multi-line spans removed\n";

    // Opener pairs with the nearest closer, not the last one
    assert(strip_comments("<!-- a --> mid <!-- b -->") == " mid ");
    std::cout << "✓ Matching is non-greedy\n";

    assert(strip_comments("head <!-- never closed e.g.") == "head <!-- never closed e.g.");
    assert(strip_comments("<!-- a --> x <!-- open") == " x <!-- open");
    assert(strip_comments("stray --> closer") == "stray --> closer");
    std::cout << "✓ Unterminated opener leaves the rest intact\n";

    // The closer must come after the full opener
    assert(strip_comments("<!-->x") == "<!-->x");
    assert(strip_comments("<!---->") == "");
    std::cout << "✓ Delimiters do not overlap\n";

    // A first pass would leave "<!-- y -->" behind
    assert(strip_comments("<!<!-- x -->-- y -->z") == "z");
    const std::string samples[] = {
        "plain", "a <!-- b --> c", "<!<!-- x -->-- y -->", "<!-- open", "x\n<!--\n-->\ny",
        "<<!-- -->!<!-- -->-<!-- -->- nested --> tail",
    };
    for (const auto& s : samples) {
        auto once = strip_comments(s);
        assert(strip_comments(once) == once);
    }
    std::cout << "✓ Stripping is idempotent\n";

    const size_t depth = 100000;
    std::string nested;
    for (size_t i = 0; i < depth; ++i) nested += "<!";
    nested += "<!-- -->";
    for (size_t i = 0; i < depth; ++i) nested += "-- -->";
    assert(strip_comments(nested + "end") == "end");
    std::string deep_open = nested.substr(0, depth * 2) + "<!-- x";
    assert(strip_comments(deep_open) == deep_open);
    std::cout << "✓ Deeply nested input stripped in one pass\n";
    return 0;
}
