// Fuzz target for parse(). Any accepted document is serialized and parsed
// again; the second parse must succeed and produce an equal value.

#include <leptjson-cpp/leptjson.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto options = leptjson_cpp::ParseOptions::hardened();
    options.allow_comments = size > 0 && (data[0] & 1) != 0;
    options.allow_trailing_commas = size > 0 && (data[0] & 2) != 0;

    auto result = leptjson_cpp::parse(text, options);
    if (!result) {
        // Describing a failure must not crash either.
        auto message = leptjson_cpp::describe(result, text);
        (void)message;
        return 0;
    }

    const auto compact = leptjson_cpp::stringify(result.value);
    auto again = leptjson_cpp::parse(compact);
    if (!again || !(again.value == result.value)) std::abort();

    const auto pretty = leptjson_cpp::stringify(result.value, {.indent = 2});
    auto pretty_again = leptjson_cpp::parse(pretty);
    if (!pretty_again || !(pretty_again.value == result.value)) std::abort();
    return 0;
}
