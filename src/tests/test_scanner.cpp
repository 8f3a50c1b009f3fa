#include "scanner.hpp"
#include "temp_tree.hpp"
#include <cassert>
#include <iostream>
#include <string>

using namespace doclint;

int main() {
    Scanner scanner(PatternSet::defaults());

    auto r1 = scanner.scan_text("Use e.g. this method");
    assert(r1.matches.size() == 1);
    assert(r1.matches[0].pattern == "e.g.");
    assert(r1.matches[0].line == "use e.g. this method");
    std::cout << "✓ Pattern found with lower-cased line\n";

    auto r2 = scanner.scan_text("<!-- e.g. inside comment -->\nClean line");
    assert(r2.clean());
    auto r3 = scanner.scan_text("Before\n<!--\nsee e.g. this\n-->\nAfter");
    assert(r3.clean());
    std::cout << "✓ Comment content ignored\n";

    auto r4 = scanner.scan_text("<!-- e.g. hidden -->\nvisible e.g. text");
    assert(r4.matches.size() == 1 && r4.matches[0].line == "visible e.g. text");
    std::cout << "✓ Content outside comments still matched\n";

    auto accented = scanner.scan_text("\xC3\x89TUDE: see E.G. this\nfine");
    assert(accented.matches.size() == 1);
    assert(accented.matches[0].line == "\xC3\xA9tude: see e.g. this");
    auto greek = Scanner(*PatternSet::from_list({"\xCE\xA0.\xCF\x87."})).scan_text("\xCF\x80.\xCE\xA7. here");
    assert(greek.matches.size() == 1 && greek.matches[0].pattern == "\xCF\x80.\xCF\x87.");
    std::cout << "✓ Non-ASCII text lower-cased before matching\n";

    for (const char* text : {"E.G. shouting", "e.G. mixed", "E.g. title"}) {
        auto r = scanner.scan_text(text);
        assert(r.find("e.g.") != nullptr);
    }
    std::cout << "✓ Case-insensitive\n";

    auto r5 = scanner.scan_text("first i.e. line\nmiddle\nlast i.e. line\nend");
    assert(r5.matches.size() == 1 && r5.matches[0].line == "last i.e. line");
    std::cout << "✓ Last offending line kept per pattern\n";

    auto r6 = scanner.scan_text("a list etc\nan e.g. sample\nthat is, i.e. this");
    assert(r6.matches.size() == 3);
    assert(r6.matches[0].pattern == "i.e." && r6.matches[0].line == "that is, i.e. this");
    assert(r6.matches[1].pattern == "e.g." && r6.matches[1].line == "an e.g. sample");
    assert(r6.matches[2].pattern == " etc" && r6.matches[2].line == "a list etc");
    std::cout << "✓ Patterns tracked independently in set order\n";

    assert(scanner.scan_text("No abbreviations at all.\nFine.").clean());
    assert(Scanner(PatternSet()).scan_text("e.g. i.e. etc").clean());
    assert(scanner.scan_text("").clean());
    std::cout << "✓ No false positives\n";

    TempTree tree("scanner");
    auto doc = tree.write("guide.md", "Intro\r\nMore ETC stuff\r\n<!-- i.e. -->\r\n");
    auto rf = scanner.scan_file(doc);
    assert(rf.path == doc.string());
    assert(rf.matches.size() == 1 && rf.matches[0].pattern == " etc");
    assert(rf.matches[0].line == "more etc stuff");

    auto missing = scanner.scan_file(tree.root() / "deleted.md");
    assert(missing.clean());
    assert(scanner.scan_file(tree.root()).clean());
    std::cout << "✓ Files scanned, missing files are clean\n";
    return 0;
}
