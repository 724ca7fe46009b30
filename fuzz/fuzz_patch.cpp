// Fuzz target for JSON Patch and JSON Merge Patch. The input is parsed as an
// array [document, patch]; both patch flavours are applied, and diff() output
// must reproduce its target.

#include <leptjson-cpp/leptjson.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace lj = leptjson_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    auto result = lj::parse(text, lj::ParseOptions::hardened());
    if (!result || !result.value.is_array() || result.value.size() != 2) return 0;

    const auto& source = result.value[0];
    const auto& patch = result.value[1];

    // Atomic application leaves the document untouched on failure.
    auto doc = source;
    try {
        lj::apply_patch_atomic(doc, lj::parse_patch(patch));
    } catch (const lj::PatchException&) {
        if (!(doc == source)) std::abort();
    }

    auto replay = source;
    lj::apply_patch(replay, lj::diff(source, patch));
    if (!(replay == patch)) std::abort();

    auto merged = lj::apply_merge_patch(source, patch);
    (void)merged;
    return 0;
}
