// json_interop_demo: leptjson-cpp + nlohmann/json interoperability
//
// Demonstrates:
//   - Exporting a parsed document to nlohmann::json
//   - Importing nlohmann::json data back into a Value
//   - Implicit conversions through ADL (json j = value; j.get<Value>())
//   - Carrying patch operations through nlohmann::json
//
// Build: cmake --build build -DLEPTJSON_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/json_interop_demo

#include <leptjson-cpp/interop.hpp>
#include <leptjson-cpp/leptjson.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <vector>

namespace lj = leptjson_cpp;
using json = nlohmann::json;

int main() {
    // -- Value -> nlohmann::json ----------------------------------------------
    auto parsed = lj::parse(R"({"name":"widget","sizes":[1,2.5,3],"meta":{"active":true}})");
    if (!parsed) return 1;

    auto exported = lj::export_json(parsed.value);
    std::printf("exported: %s\n", exported.dump().c_str());
    std::printf("sizes[1]: %g\n", exported["sizes"][1].get<double>());

    // -- nlohmann::json -> Value ----------------------------------------------
    auto config = json{
        {"retries", 3},
        {"endpoints", {"a.example", "b.example"}},
        {"tls", {{"verify", true}}},
    };
    auto imported = lj::import_json(config);
    std::printf("imported: %s\n", lj::stringify(imported).c_str());

    // -- ADL conversions --------------------------------------------------------
    json j = imported;
    auto back = j.get<lj::Value>();
    std::printf("round trip equal: %s\n", back == imported ? "yes" : "no");

    // -- Patch operations as nlohmann::json ------------------------------------
    auto op = lj::Operation{
        .kind = lj::OpKind::replace,
        .path = lj::Pointer::parse("/retries"),
        .from = {},
        .value = 5,
    };
    json op_json = op;
    std::printf("operation: %s\n", op_json.dump().c_str());

    auto ops = std::vector<lj::Operation>{op_json.get<lj::Operation>()};
    lj::apply_patch(imported, ops);
    std::printf("patched:  %s\n", lj::stringify(imported).c_str());

    return 0;
}
