#include "json.hpp"
#include <cassert>
#include <iostream>
#include <string>

int main() {
    auto doc = json::parse(R"( {"name": "doc\"lint", "n": -12.5e1, "ok": true, "none": null,
                               "list": [1, "two", {"three": 3}], "empty": {}} )");
    assert(doc.is_object());
    assert(doc["name"].as_string() == "doc\"lint");
    assert(doc["n"].as_number() == -125.0);
    assert(doc["ok"].as_bool());
    assert(doc["none"].is_null());
    assert(doc["list"].as_array().size() == 3);
    assert(doc["list"].as_array()[2]["three"].as_number() == 3.0);
    assert(doc["empty"].as_object().empty());
    assert(doc["missing"].is_null());
    assert(doc.contains("ok") && !doc.contains("nope"));
    std::cout << "✓ Parse objects, arrays and scalars\n";

    auto esc = json::parse(R"("tab\t nl\n \u00e9 \ud83d\ude00 \/")");
    assert(esc.as_string() == "tab\t nl\n \xC3\xA9 \xF0\x9F\x98\x80 /");
    std::cout << "✓ Escapes and surrogate pairs\n";

    const char* bad[] = {"", "{", "[1,]", "{\"a\" 1}", "tru", "\"open", "{\"a\":1} x", "\"\\ud800\"", "01x"};
    for (const char* input : bad) {
        bool threw = false;
        try {
            json::parse(input);
        } catch (const json::ParseError&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "✓ Malformed input rejected\n";

    for (const char* number : {"01", "-01", "1.", "1.e5", ".5", "-", "+1", "1e", "1e+", "0x10", "--1", "1.5.2", "1e5e5"}) {
        bool threw = false;
        try {
            json::parse(number);
        } catch (const json::ParseError&) {
            threw = true;
        }
        assert(threw);
    }
    assert(json::parse("0").as_number() == 0.0);
    assert(json::parse("-0.5").as_number() == -0.5);
    assert(json::parse("10").as_number() == 10.0);
    assert(json::parse("1.25e2").as_number() == 125.0);
    assert(json::parse("2E-1").as_number() == 0.2);
    assert(json::parse("[0,-1e+2]").as_array()[1].as_number() == -100.0);
    std::cout << "✓ Number grammar enforced\n";

    json::Value v(json::Object{{"b", json::Array{1, "x\"y\n"}}, {"a", true}});
    assert(v.dump() == R"({"a":true,"b":[1,"x\"y\n"]})");
    assert(json::parse(v.dump())["b"].as_array()[1].as_string() == "x\"y\n");
    std::cout << "✓ Serialization\n";
    return 0;
}
