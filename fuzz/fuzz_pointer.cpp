// Fuzz target for Pointer::parse() and pointer resolution. The input is split
// at the first newline: the first line is a pointer, the rest a document.

#include <leptjson-cpp/leptjson.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <utility>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\n');
    const auto pointer_text = input.substr(0, split);
    const auto doc_text = split == std::string_view::npos ? std::string_view{}
                                                          : input.substr(split + 1);

    try {
        const auto pointer = leptjson_cpp::Pointer::parse(pointer_text);
        // A parsed pointer re-serializes to the text it came from.
        if (pointer.to_string() != pointer_text) std::abort();

        auto result = leptjson_cpp::parse(doc_text, leptjson_cpp::ParseOptions::hardened());
        if (!result) return 0;

        const auto* found = leptjson_cpp::find(result.value, pointer);
        try {
            const auto& resolved = leptjson_cpp::resolve(std::as_const(result.value), pointer);
            if (found != &resolved) std::abort();
        } catch (const leptjson_cpp::Exception&) {
            if (found != nullptr) std::abort();
        }
    } catch (const leptjson_cpp::Exception&) {
        // Malformed pointer text.
    }
    return 0;
}
