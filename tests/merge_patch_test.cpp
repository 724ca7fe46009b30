#include <leptjson-cpp/leptjson.hpp>

#include <gtest/gtest.h>

#include <string_view>
#include <utility>
#include <vector>

using namespace leptjson_cpp;

namespace {

auto doc(std::string_view text) -> Value {
    auto result = parse(text);
    EXPECT_EQ(result.error, ParseError::ok) << text;
    return result.value;
}

auto merged(std::string_view target, std::string_view patch) -> Value {
    return apply_merge_patch(doc(target), doc(patch));
}

}  // anonymous namespace

// -- apply_merge_patch --------------------------------------------------------

TEST(MergePatch, null_deletes_member) {
    EXPECT_EQ(merged(R"({"a":1,"b":2})", R"({"a":null})"), doc(R"({"b":2})"));
}

TEST(MergePatch, nested_objects_merge_recursively) {
    EXPECT_EQ(merged(R"({"a":{"x":1}})", R"({"a":{"x":null,"y":2}})"), doc(R"({"a":{"y":2}})"));
}

TEST(MergePatch, rfc7396_appendix_a) {
    // Each row is {target, patch, result}.
    const auto cases = std::vector<std::vector<std::string_view>>{
        {R"({"a":"b"})", R"({"a":"c"})", R"({"a":"c"})"},
        {R"({"a":"b"})", R"({"b":"c"})", R"({"a":"b","b":"c"})"},
        {R"({"a":"b"})", R"({"a":null})", R"({})"},
        {R"({"a":"b","b":"c"})", R"({"a":null})", R"({"b":"c"})"},
        {R"({"a":["b"]})", R"({"a":"c"})", R"({"a":"c"})"},
        {R"({"a":"c"})", R"({"a":["b"]})", R"({"a":["b"]})"},
        {R"({"a":{"b":"c"}})", R"({"a":{"b":"d","c":null}})", R"({"a":{"b":"d"}})"},
        {R"({"a":[{"b":"c"}]})", R"({"a":[1]})", R"({"a":[1]})"},
        {R"(["a","b"])", R"(["c","d"])", R"(["c","d"])"},
        {R"({"a":"b"})", R"(["c"])", R"(["c"])"},
        {R"({"a":"foo"})", R"(null)", R"(null)"},
        {R"({"a":"foo"})", R"("bar")", R"("bar")"},
        {R"({"e":null})", R"({"a":1})", R"({"e":null,"a":1})"},
        {R"([1,2])", R"({"a":"b","c":null})", R"({"a":"b"})"},
        // An object patch value for an absent member is stored as given,
        // nested nulls included.
        {R"({})", R"({"a":{"bb":{"ccc":null}}})", R"({"a":{"bb":{"ccc":null}}})"},
    };
    for (const auto& row : cases) {
        EXPECT_EQ(merged(row[0], row[1]), doc(row[2])) << row[0] << " + " << row[1];
    }
}

TEST(MergePatch, does_not_modify_inputs) {
    const auto target = doc(R"({"a":{"b":1}})");
    const auto patch = doc(R"({"a":{"b":null,"c":[1]}})");
    auto result = apply_merge_patch(target, patch);
    EXPECT_EQ(target, doc(R"({"a":{"b":1}})"));
    EXPECT_EQ(patch, doc(R"({"a":{"b":null,"c":[1]}})"));
    EXPECT_EQ(result, doc(R"({"a":{"c":[1]}})"));
}

TEST(MergePatch, result_shares_nothing_with_patch) {
    auto patch = doc(R"({"list":[1]})");
    auto result = apply_merge_patch(Value::object(), patch);
    patch["list"].push_back(2);
    EXPECT_EQ(result, doc(R"({"list":[1]})"));
}

TEST(MergePatch, in_place_variant) {
    auto target = doc(R"({"keep":true,"drop":1,"nested":{"x":1}})");
    merge_patch(target, doc(R"({"drop":null,"nested":{"y":2},"add":"new"})"));
    EXPECT_EQ(target, doc(R"({"keep":true,"nested":{"x":1,"y":2},"add":"new"})"));
}

TEST(MergePatch, absent_keys_are_untouched_and_missing_deletes_are_ignored) {
    EXPECT_EQ(merged(R"({"a":1})", R"({"b":null})"), doc(R"({"a":1})"));
    EXPECT_EQ(merged(R"({"a":1})", R"({})"), doc(R"({"a":1})"));
}

// -- create_merge_patch -------------------------------------------------------

TEST(CreateMergePatch, non_objects_yield_target) {
    EXPECT_EQ(create_merge_patch(doc("[1]"), doc("[2]")), doc("[2]"));
    EXPECT_EQ(create_merge_patch(doc(R"({"a":1})"), doc("3")), doc("3"));
    EXPECT_EQ(create_merge_patch(doc("3"), doc(R"({"a":1})")), doc(R"({"a":1})"));
}

TEST(CreateMergePatch, equal_objects_yield_empty_patch) {
    EXPECT_EQ(create_merge_patch(doc(R"({"a":{"b":[1]}})"), doc(R"({"a":{"b":[1]}})")),
              Value::object());
}

TEST(CreateMergePatch, added_changed_and_removed_keys) {
    EXPECT_EQ(create_merge_patch(doc(R"({"same":1,"changed":1,"gone":1,"obj":{"x":1,"y":1}})"),
                                 doc(R"({"same":1,"changed":2,"new":[],"obj":{"x":1,"y":2}})")),
              doc(R"({"changed":2,"new":[],"gone":null,"obj":{"y":2}})"));
}

TEST(CreateMergePatch, unchanged_nested_object_is_omitted) {
    EXPECT_EQ(create_merge_patch(doc(R"({"o":{"x":1},"v":1})"), doc(R"({"o":{"x":1},"v":2})")),
              doc(R"({"v":2})"));
}

TEST(CreateMergePatch, applying_generated_patch_reproduces_target) {
    const auto pairs = std::vector<std::pair<std::string_view, std::string_view>>{
        {R"({})", R"({"a":1})"},
        {R"({"a":1})", R"({})"},
        {R"({"a":{"b":{"c":1}}})", R"({"a":{"b":{"d":2}}})"},
        {R"({"a":[1,2],"b":"x"})", R"({"a":[2],"b":{"now":"object"}})"},
        {R"({"a":{"nested":true}})", R"({"a":"scalar"})"},
        {R"({"a":"scalar"})", R"({"a":{"nested":true}})"},
        {R"({"list":[{"x":1}]})", R"({"list":[{"x":2}],"extra":false})"},
    };
    for (const auto& [a_text, b_text] : pairs) {
        const auto a = doc(a_text);
        const auto b = doc(b_text);
        EXPECT_EQ(apply_merge_patch(a, create_merge_patch(a, b)), b)
            << a_text << " -> " << b_text;
    }
}
