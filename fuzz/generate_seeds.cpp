// Helper to generate seed corpus files for the fuzz targets.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <leptjson-cpp/leptjson.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace lj = leptjson_cpp;

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto parse_dir = std::string{"fuzz/corpus/parse"};
    const auto pointer_dir = std::string{"fuzz/corpus/pointer"};
    const auto patch_dir = std::string{"fuzz/corpus/patch"};
    fs::create_directories(parse_dir);
    fs::create_directories(pointer_dir);
    fs::create_directories(patch_dir);

    // -- parse seeds ------------------------------------------------------------
    write_seed(parse_dir + "/seed_literals.json", "[null,true,false]");
    write_seed(parse_dir + "/seed_numbers.json", "[0,-0,1.5e-3,-12E+4,1.7976931348623157e308]");
    write_seed(parse_dir + "/seed_strings.json", R"(["\"\\\/\b\f\n\r\t","\u00e9\ud834\udd1e"])");
    write_seed(parse_dir + "/seed_comments.json", "// lead\n[1, /* mid */ 2,]");
    {
        auto doc = lj::Value::object({
            {"name", "seed"},
            {"list", lj::Value::array({1, 2, lj::Value::array({3})})},
            {"nested", lj::Value::object({{"ok", true}, {"none", lj::Null{}}})},
        });
        write_seed(parse_dir + "/seed_nested.json", lj::stringify(doc, {.indent = 2}));
    }

    // -- pointer seeds ----------------------------------------------------------
    write_seed(pointer_dir + "/seed_root.txt", "\n{\"a\":1}");
    write_seed(pointer_dir + "/seed_escaped.txt", "/a~1b/m~0n\n{\"a/b\":{\"m~n\":[0]}}");
    write_seed(pointer_dir + "/seed_index.txt", "/items/1\n{\"items\":[10,20,30]}");
    write_seed(pointer_dir + "/seed_dash.txt", "/items/-\n{\"items\":[]}");

    // -- patch seeds ------------------------------------------------------------
    {
        const auto source = lj::Value::object({{"a", 1}, {"b", lj::Value::array({1, 2})}});
        const auto target = lj::Value::object({{"a", 2}, {"c", lj::Value::array({2})}});
        write_seed(patch_dir + "/seed_objects.json",
                   lj::stringify(lj::Value::array({source, target})));
        write_seed(patch_dir + "/seed_ops.json",
                   lj::stringify(lj::Value::array({source, lj::to_value(lj::diff(source, target))})));
    }
    write_seed(patch_dir + "/seed_merge.json", R"([{"a":{"b":1}},{"a":{"b":null,"c":2}}])");

    return 0;
}
