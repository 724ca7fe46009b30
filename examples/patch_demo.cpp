// patch_demo: JSON Patch (RFC 6902) and JSON Merge Patch (RFC 7396)
//
// Demonstrates:
//   - Applying a patch document to a configuration
//   - Reporting which operation failed, and why
//   - All-or-nothing application with apply_patch_atomic()
//   - Computing a patch with diff() and a merge patch with create_merge_patch()
//
// Build: cmake --build build -DLEPTJSON_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/patch_demo

#include <leptjson-cpp/leptjson.hpp>

#include <cstdio>
#include <string_view>
#include <vector>

namespace lj = leptjson_cpp;

static auto must_parse(std::string_view text) -> lj::Value {
    auto result = lj::parse(text);
    if (!result) {
        std::printf("%s\n", lj::describe(result, text).c_str());
        return lj::Value{};
    }
    return result.value;
}

static void print(const char* label, const lj::Value& v) {
    std::printf("%-10s %s\n", label, lj::stringify(v).c_str());
}

int main() {
    auto config = must_parse(R"({
        "server": {"host": "localhost", "port": 8080},
        "features": ["auth", "metrics"],
        "debug": true
    })");
    print("config:", config);

    // =========================================================================
    // JSON Patch
    // =========================================================================

    const auto patch = must_parse(R"([
        {"op": "test", "path": "/server/port", "value": 8080},
        {"op": "replace", "path": "/server/port", "value": 9090},
        {"op": "add", "path": "/features/-", "value": "tracing"},
        {"op": "move", "from": "/debug", "path": "/server/debug"},
        {"op": "copy", "from": "/server/host", "path": "/primary"}
    ])");

    lj::apply_patch(config, patch);
    print("patched:", config);

    // -- Failures name the operation --------------------------------------------
    const auto bad = lj::parse_patch(must_parse(R"([
        {"op": "remove", "path": "/features/0"},
        {"op": "remove", "path": "/missing"}
    ])"));

    auto before = config;
    try {
        lj::apply_patch_atomic(config, bad);
    } catch (const lj::PatchException& e) {
        std::printf("\nrejected:  %s\n", e.what());
        std::printf("unchanged: %s\n", config == before ? "yes" : "no");
    }

    // -- diff() produces a patch that reproduces the target -------------------
    const auto target = must_parse(R"({
        "server": {"host": "example.org", "port": 443},
        "features": ["auth"]
    })");
    const auto ops = lj::diff(config, target);
    std::printf("\ndiff (%zu ops):\n%s\n", ops.size(),
                lj::stringify(lj::to_value(ops), lj::StringifyOptions{.indent = 2}).c_str());

    auto replayed = config;
    lj::apply_patch(replayed, ops);
    std::printf("replay matches target: %s\n", replayed == target ? "yes" : "no");

    // =========================================================================
    // JSON Merge Patch
    // =========================================================================

    const auto merge = lj::create_merge_patch(config, target);
    print("\nmerge:", merge);
    print("merged:", lj::apply_merge_patch(config, merge));

    auto settings = must_parse(R"({"theme": "dark", "font": {"size": 12, "family": "mono"}})");
    lj::merge_patch(settings, must_parse(R"({"font": {"size": 14, "family": null}})"));
    print("settings:", settings);

    return 0;
}
