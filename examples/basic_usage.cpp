// basic_usage: demonstrates the core leptjson-cpp API
//
// Shows parsing with error reporting, building values with Value::array()
// and Value::object(), typed accessors, operator[], deep copies, pointer
// lookups, and compact vs. indented output.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <leptjson-cpp/leptjson.hpp>

#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

namespace lj = leptjson_cpp;

int main() {
    // -- Parse a document -----------------------------------------------------
    const auto text = std::string_view{R"({
        "title": "Shopping List",
        "items": ["Milk", "Eggs", "Bread"],
        "config": {"theme": "dark", "max_items": 100}
    })"};

    auto result = lj::parse(text);
    if (!result) {
        std::printf("%s\n", lj::describe(result, text).c_str());
        return 1;
    }
    auto doc = std::move(result.value);

    std::printf("title: %s\n", doc.at("title").as_string().c_str());
    std::printf("items: %zu\n", doc.at("items").size());
    std::printf("max_items: %g\n", doc.at("config").at("max_items").as_number());

    // -- Malformed input reports where it went wrong --------------------------
    const auto broken = std::string_view{"{\"a\": [1, 2\n  3]}"};
    auto failed = lj::parse(broken);
    std::printf("\n%s\n", lj::describe(failed, broken).c_str());

    // -- Build values directly -------------------------------------------------
    auto entry = lj::Value::object({
        {"name", "Butter"},
        {"qty", 2},
        {"tags", lj::Value::array({"dairy", "cold"})},
    });
    doc["items"].push_back("Butter");
    doc["details"] = lj::Value::array({entry});

    // -- Copies are deep -------------------------------------------------------
    auto snapshot = doc;
    doc["config"]["theme"] = "light";
    std::printf("\nsnapshot theme: %s, live theme: %s\n",
                snapshot.at("config").at("theme").as_string().c_str(),
                doc.at("config").at("theme").as_string().c_str());
    std::printf("equal after edit: %s\n", snapshot == doc ? "yes" : "no");

    // -- JSON Pointer lookups --------------------------------------------------
    const auto tag = lj::Pointer::parse("/details/0/tags/1");
    std::printf("%s -> %s\n", tag.to_string().c_str(),
                lj::stringify(lj::resolve(doc, tag)).c_str());
    if (lj::find(doc, lj::Pointer::parse("/missing")) == nullptr) {
        std::printf("/missing -> (absent)\n");
    }

    // -- Output ----------------------------------------------------------------
    std::printf("\ncompact:\n%s\n", lj::stringify(doc).c_str());
    std::printf("\nindented:\n%s\n",
                lj::stringify(doc, lj::StringifyOptions{.indent = 2}).c_str());

    return 0;
}
