#include <leptjson-cpp/leptjson.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace leptjson_cpp;

namespace {

auto error_of(std::string_view text, const ParseOptions& options = {}) -> ParseError {
    return parse(text, options).error;
}

auto number_of(std::string_view text) -> double {
    auto result = parse(text);
    EXPECT_EQ(result.error, ParseError::ok) << text;
    return result.value.is_number() ? result.value.as_number() : -12345.0;
}

auto string_of(std::string_view text) -> std::string {
    auto result = parse(text);
    EXPECT_EQ(result.error, ParseError::ok) << text;
    return result.value.is_string() ? result.value.as_string() : std::string{};
}

}  // anonymous namespace

// -- ParseError ---------------------------------------------------------------

TEST(ParseError, to_string_view_names_each_variant) {
    EXPECT_EQ(to_string_view(ParseError::ok), "ok");
    EXPECT_EQ(to_string_view(ParseError::expect_value), "expect_value");
    EXPECT_EQ(to_string_view(ParseError::miss_comma_or_square_bracket),
              "miss_comma_or_square_bracket");
    EXPECT_EQ(to_string_view(ParseError::comment_not_closed), "comment_not_closed");
    EXPECT_EQ(to_string_view(ParseError::number_range_exceeded), "number_range_exceeded");
}

// -- Literals -----------------------------------------------------------------

TEST(ParseLiteral, null_true_false) {
    auto n = parse("null");
    ASSERT_TRUE(n);
    EXPECT_TRUE(n.value.is_null());

    auto t = parse("true");
    ASSERT_TRUE(t);
    EXPECT_TRUE(t.value.as_bool());

    auto f = parse(" \t\r\nfalse \n");
    ASSERT_TRUE(f);
    EXPECT_FALSE(f.value.as_bool());
}

TEST(ParseLiteral, expect_value_on_empty_input) {
    EXPECT_EQ(error_of(""), ParseError::expect_value);
    EXPECT_EQ(error_of("   "), ParseError::expect_value);
}

TEST(ParseLiteral, invalid_value_on_bad_literal) {
    EXPECT_EQ(error_of("nul"), ParseError::invalid_value);
    EXPECT_EQ(error_of("tru"), ParseError::invalid_value);
    EXPECT_EQ(error_of("?"), ParseError::invalid_value);
    EXPECT_EQ(error_of("NULL"), ParseError::invalid_value);
}

TEST(ParseLiteral, root_not_singular_on_trailing_content) {
    EXPECT_EQ(error_of("null x"), ParseError::root_not_singular);
    EXPECT_EQ(error_of("truex"), ParseError::root_not_singular);
    EXPECT_EQ(error_of("0123"), ParseError::invalid_value);
    EXPECT_EQ(error_of("1 2"), ParseError::root_not_singular);
}

// -- Numbers ------------------------------------------------------------------

TEST(ParseNumber, zero_forms_parse_to_zero) {
    EXPECT_EQ(number_of("0"), 0.0);
    EXPECT_EQ(number_of("-0"), 0.0);
    EXPECT_EQ(number_of("-0.0"), 0.0);
    EXPECT_EQ(number_of("0.0"), 0.0);
}

TEST(ParseNumber, valid_forms) {
    EXPECT_DOUBLE_EQ(number_of("1"), 1.0);
    EXPECT_DOUBLE_EQ(number_of("-1"), -1.0);
    EXPECT_DOUBLE_EQ(number_of("1.5"), 1.5);
    EXPECT_DOUBLE_EQ(number_of("-1.5"), -1.5);
    EXPECT_DOUBLE_EQ(number_of("3.1416"), 3.1416);
    EXPECT_DOUBLE_EQ(number_of("1E10"), 1e10);
    EXPECT_DOUBLE_EQ(number_of("1e10"), 1e10);
    EXPECT_DOUBLE_EQ(number_of("1E+10"), 1e10);
    EXPECT_DOUBLE_EQ(number_of("1E-10"), 1e-10);
    EXPECT_DOUBLE_EQ(number_of("-1E10"), -1e10);
    EXPECT_DOUBLE_EQ(number_of("1.234E+10"), 1.234e10);
}

TEST(ParseNumber, boundary_doubles) {
    EXPECT_EQ(number_of("1.0000000000000002"), 1.0000000000000002);
    EXPECT_EQ(number_of("2.2250738585072014e-308"), 2.2250738585072014e-308);
    EXPECT_EQ(number_of("1.7976931348623157e+308"), 1.7976931348623157e+308);
    EXPECT_EQ(number_of("-1.7976931348623157e+308"), -1.7976931348623157e+308);
}

TEST(ParseNumber, subnormals_are_preserved) {
    EXPECT_EQ(number_of("4.9406564584124654e-324"), 4.9406564584124654e-324);
    EXPECT_EQ(number_of("5e-324"), 4.9406564584124654e-324);
    EXPECT_EQ(number_of("-5e-324"), -4.9406564584124654e-324);
    EXPECT_EQ(number_of("2.2250738585072009e-308"), 2.2250738585072009e-308);
    EXPECT_NE(number_of("1e-310"), 0.0);
}

TEST(ParseNumber, underflow_becomes_zero) {
    EXPECT_EQ(number_of("1e-10000"), 0.0);
    EXPECT_EQ(number_of("-1e-10000"), 0.0);
}

TEST(ParseNumber, strict_grammar_rejects_invalid_forms) {
    EXPECT_EQ(error_of("01"), ParseError::invalid_value);
    EXPECT_EQ(error_of("+1"), ParseError::invalid_value);
    EXPECT_EQ(error_of("1."), ParseError::invalid_value);
    EXPECT_EQ(error_of(".1"), ParseError::invalid_value);
    EXPECT_EQ(error_of("1e"), ParseError::invalid_value);
    EXPECT_EQ(error_of("1e+"), ParseError::invalid_value);
    EXPECT_EQ(error_of("-"), ParseError::invalid_value);
    EXPECT_EQ(error_of("0x0"), ParseError::invalid_value);
    EXPECT_EQ(error_of("0x123"), ParseError::invalid_value);
    EXPECT_EQ(error_of("INF"), ParseError::invalid_value);
    EXPECT_EQ(error_of("NAN"), ParseError::invalid_value);
}

TEST(ParseNumber, overflow_is_number_too_big) {
    EXPECT_EQ(error_of("1e309"), ParseError::number_too_big);
    EXPECT_EQ(error_of("-1e309"), ParseError::number_too_big);
}

// -- Strings ------------------------------------------------------------------

TEST(ParseString, plain_and_escaped) {
    EXPECT_EQ(string_of(R"("")"), "");
    EXPECT_EQ(string_of(R"("Hello")"), "Hello");
    EXPECT_EQ(string_of(R"("Hello\nWorld")"), "Hello\nWorld");
    EXPECT_EQ(string_of(R"("\" \\ \/ \b \f \n \r \t")"), "\" \\ / \b \f \n \r \t");
}

TEST(ParseString, embedded_nul_via_escape) {
    EXPECT_EQ(string_of(R"("Hello\u0000World")"), std::string("Hello\0World", 11));
}

TEST(ParseString, unicode_escapes_encode_utf8) {
    EXPECT_EQ(string_of(R"("\u0024")"), "\x24");
    EXPECT_EQ(string_of(R"("\u00A2")"), "\xC2\xA2");
    EXPECT_EQ(string_of(R"("\u20AC")"), "\xE2\x82\xAC");
    EXPECT_EQ(string_of(R"("\u20ac")"), "\xE2\x82\xAC");
}

TEST(ParseString, surrogate_pair_decodes_to_one_code_point) {
    // U+1D11E MUSICAL SYMBOL G CLEF
    EXPECT_EQ(string_of(R"("\uD834\uDD1E")"), "\xF0\x9D\x84\x9E");
    EXPECT_EQ(string_of(R"("\ud834\udd1e")"), "\xF0\x9D\x84\x9E");
}

TEST(ParseString, miss_quotation_mark) {
    EXPECT_EQ(error_of(R"(")"), ParseError::miss_quotation_mark);
    EXPECT_EQ(error_of(R"("abc)"), ParseError::miss_quotation_mark);
    EXPECT_EQ(error_of(R"("abc\)"), ParseError::miss_quotation_mark);
}

TEST(ParseString, invalid_string_escape) {
    EXPECT_EQ(error_of(R"("\v")"), ParseError::invalid_string_escape);
    EXPECT_EQ(error_of(R"("\'")"), ParseError::invalid_string_escape);
    EXPECT_EQ(error_of(R"("\0")"), ParseError::invalid_string_escape);
    EXPECT_EQ(error_of(R"("\x12")"), ParseError::invalid_string_escape);
}

TEST(ParseString, invalid_string_char) {
    EXPECT_EQ(error_of("\"\x01\""), ParseError::invalid_string_char);
    EXPECT_EQ(error_of("\"\x1F\""), ParseError::invalid_string_char);
    EXPECT_EQ(error_of("\"a\nb\""), ParseError::invalid_string_char);
}

TEST(ParseString, invalid_unicode_hex) {
    EXPECT_EQ(error_of(R"("\u")"), ParseError::invalid_unicode_hex);
    EXPECT_EQ(error_of(R"("\u0")"), ParseError::invalid_unicode_hex);
    EXPECT_EQ(error_of(R"("\u01")"), ParseError::invalid_unicode_hex);
    EXPECT_EQ(error_of(R"("\u012")"), ParseError::invalid_unicode_hex);
    EXPECT_EQ(error_of(R"("\u/000")"), ParseError::invalid_unicode_hex);
    EXPECT_EQ(error_of(R"("\uG000")"), ParseError::invalid_unicode_hex);
    EXPECT_EQ(error_of(R"("\u0/00")"), ParseError::invalid_unicode_hex);
    EXPECT_EQ(error_of(R"("\u 123")"), ParseError::invalid_unicode_hex);
    EXPECT_EQ(error_of(R"("\uD800\uZZZZ")"), ParseError::invalid_unicode_hex);
}

TEST(ParseString, invalid_unicode_surrogate) {
    EXPECT_EQ(error_of(R"("\uD800")"), ParseError::invalid_unicode_surrogate);
    EXPECT_EQ(error_of(R"("\uDBFF")"), ParseError::invalid_unicode_surrogate);
    EXPECT_EQ(error_of(R"("\uDC00")"), ParseError::invalid_unicode_surrogate);
    EXPECT_EQ(error_of(R"("\uD800\\")"), ParseError::invalid_unicode_surrogate);
    EXPECT_EQ(error_of(R"("\uD800x")"), ParseError::invalid_unicode_surrogate);
    EXPECT_EQ(error_of(R"("\uD800\uDBFF")"), ParseError::invalid_unicode_surrogate);
}

// -- Arrays -------------------------------------------------------------------

TEST(ParseArray, empty_and_nested) {
    auto empty = parse("[ ]");
    ASSERT_TRUE(empty);
    EXPECT_EQ(empty.value, Value::array());

    auto mixed = parse(R"([ null , false , true , 123 , "abc" ])");
    ASSERT_TRUE(mixed);
    EXPECT_EQ(mixed.value, Value::array({Null{}, false, true, 123, "abc"}));

    auto nested = parse("[ [ ] , [ 0 ] , [ 0 , 1 ] , [ 0 , 1 , 2 ] ]");
    ASSERT_TRUE(nested);
    ASSERT_EQ(nested.value.size(), 4u);
    EXPECT_EQ(nested.value[3], Value::array({0, 1, 2}));
}

TEST(ParseArray, miss_comma_or_square_bracket) {
    EXPECT_EQ(error_of("[1,2"), ParseError::miss_comma_or_square_bracket);
    EXPECT_EQ(error_of("[1 2]"), ParseError::miss_comma_or_square_bracket);
    EXPECT_EQ(error_of("[1}"), ParseError::miss_comma_or_square_bracket);
    EXPECT_EQ(error_of("[[]"), ParseError::miss_comma_or_square_bracket);
}

TEST(ParseArray, invalid_elements) {
    EXPECT_EQ(error_of("[1,]"), ParseError::invalid_value);
    EXPECT_EQ(error_of(R"(["a", nul])"), ParseError::invalid_value);
    EXPECT_EQ(error_of("["), ParseError::expect_value);
    EXPECT_EQ(error_of("[1,"), ParseError::expect_value);
}

// -- Objects ------------------------------------------------------------------

TEST(ParseObject, members_in_order) {
    auto result = parse(R"( {
        "n" : null , "f" : false , "t" : true , "i" : 123 , "s" : "abc",
        "a" : [ 1, 2, 3 ],
        "o" : { "1" : 1, "2" : 2, "3" : 3 }
    } )");
    ASSERT_TRUE(result);
    const auto& members = result.value.as_object();
    ASSERT_EQ(members.size(), 7u);
    EXPECT_EQ(members[0].key, "n");
    EXPECT_EQ(members[6].key, "o");
    EXPECT_EQ(result.value.at("a"), Value::array({1, 2, 3}));
    EXPECT_DOUBLE_EQ(result.value.at("o").at("2").as_number(), 2.0);
}

TEST(ParseObject, duplicate_keys_are_kept) {
    auto result = parse(R"({"k":1,"k":2})");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value.size(), 2u);
    EXPECT_DOUBLE_EQ(result.value.at("k").as_number(), 1.0);
}

TEST(ParseObject, miss_key) {
    EXPECT_EQ(error_of("{:1,"), ParseError::miss_key);
    EXPECT_EQ(error_of("{1:1,"), ParseError::miss_key);
    EXPECT_EQ(error_of("{1:1}"), ParseError::miss_key);
    EXPECT_EQ(error_of("{true:1,"), ParseError::miss_key);
    EXPECT_EQ(error_of(R"({"a":1,})"), ParseError::miss_key);
}

TEST(ParseObject, miss_colon) {
    EXPECT_EQ(error_of(R"({"a"})"), ParseError::miss_colon);
    EXPECT_EQ(error_of(R"({"a","b"})"), ParseError::miss_colon);
}

TEST(ParseObject, miss_comma_or_curly_bracket) {
    EXPECT_EQ(error_of(R"({"a":1)"), ParseError::miss_comma_or_curly_bracket);
    EXPECT_EQ(error_of(R"({"a":1])"), ParseError::miss_comma_or_curly_bracket);
    EXPECT_EQ(error_of(R"({"a":1 "b")"), ParseError::miss_comma_or_curly_bracket);
    EXPECT_EQ(error_of(R"({"a":{})"), ParseError::miss_comma_or_curly_bracket);
}

TEST(ParseObject, failure_leaves_null_value) {
    auto result = parse(R"({"a":[1,2,{"b":}]})");
    EXPECT_EQ(result.error, ParseError::invalid_value);
    EXPECT_TRUE(result.value.is_null());
    EXPECT_FALSE(result);
}

// -- Lenient extensions -------------------------------------------------------

TEST(ParseOptions, comments_rejected_by_default) {
    EXPECT_EQ(error_of("// c\n1"), ParseError::invalid_value);
    EXPECT_EQ(error_of("[1 /* c */]"), ParseError::miss_comma_or_square_bracket);
}

TEST(ParseOptions, comments_accepted_when_enabled) {
    const auto options = ParseOptions{.allow_comments = true};
    auto result = parse(R"(// leading
        { /* block */ "a" : 1, // trailing
          "b" /* between */ : [ 2 /**/ ] }
        /* end */)", options);
    ASSERT_TRUE(result) << to_string_view(result.error);
    EXPECT_EQ(result.value, Value::object({{"a", 1}, {"b", Value::array({2})}}));
}

TEST(ParseOptions, unterminated_block_comment) {
    const auto options = ParseOptions{.allow_comments = true};
    EXPECT_EQ(error_of("/* x", options), ParseError::comment_not_closed);
    EXPECT_EQ(error_of("[1 /* x ]", options), ParseError::comment_not_closed);
    EXPECT_EQ(error_of("/ 1", options), ParseError::invalid_value);
}

TEST(ParseOptions, trailing_commas_accepted_when_enabled) {
    const auto options = ParseOptions{.allow_trailing_commas = true};
    auto arr = parse("[1,2,]", options);
    ASSERT_TRUE(arr);
    EXPECT_EQ(arr.value, Value::array({1, 2}));

    auto obj = parse(R"({"a":1,})", options);
    ASSERT_TRUE(obj);
    EXPECT_EQ(obj.value, Value::object({{"a", 1}}));

    EXPECT_EQ(error_of("[,]", options), ParseError::invalid_value);
    EXPECT_EQ(error_of("[1,,]", options), ParseError::invalid_value);
}

// -- Resource limits ----------------------------------------------------------

TEST(ParseLimits, default_depth_accepts_deep_nesting) {
    auto text = std::string(1000, '[') + std::string(1000, ']');
    EXPECT_EQ(error_of(text), ParseError::ok);

    auto too_deep = std::string(1001, '[') + std::string(1001, ']');
    EXPECT_EQ(error_of(too_deep), ParseError::max_depth_exceeded);
}

TEST(ParseLimits, max_depth) {
    const auto options = ParseOptions{.max_depth = 3};
    EXPECT_EQ(error_of("[[[1]]]", options), ParseError::ok);
    EXPECT_EQ(error_of("[[[[1]]]]", options), ParseError::max_depth_exceeded);
    EXPECT_EQ(error_of(R"({"a":{"b":{"c":{}}}})", options), ParseError::max_depth_exceeded);
}

TEST(ParseLimits, max_string_length) {
    const auto options = ParseOptions{.max_string_length = 3};
    EXPECT_EQ(error_of(R"("abc")", options), ParseError::ok);
    EXPECT_EQ(error_of(R"("abcd")", options), ParseError::max_string_length_exceeded);
    EXPECT_EQ(error_of(R"({"long_key":1})", options), ParseError::max_string_length_exceeded);
}

TEST(ParseLimits, max_array_size) {
    const auto options = ParseOptions{.max_array_size = 2};
    EXPECT_EQ(error_of("[1,2]", options), ParseError::ok);
    EXPECT_EQ(error_of("[1,2,3]", options), ParseError::max_array_size_exceeded);
}

TEST(ParseLimits, max_object_size) {
    const auto options = ParseOptions{.max_object_size = 1};
    EXPECT_EQ(error_of(R"({"a":1})", options), ParseError::ok);
    EXPECT_EQ(error_of(R"({"a":1,"b":2})", options), ParseError::max_object_size_exceeded);
}

TEST(ParseLimits, max_total_size) {
    const auto options = ParseOptions{.max_total_size = 4};
    EXPECT_EQ(error_of("true", options), ParseError::ok);
    EXPECT_EQ(error_of("false", options), ParseError::max_total_size_exceeded);
}

TEST(ParseLimits, max_number_magnitude) {
    const auto options = ParseOptions{.max_number_magnitude = 1000.0};
    EXPECT_EQ(error_of("-1000", options), ParseError::ok);
    EXPECT_EQ(error_of("1000.5", options), ParseError::number_range_exceeded);
    EXPECT_EQ(error_of("[1e4]", options), ParseError::number_range_exceeded);
}

TEST(ParseLimits, hardened_defaults) {
    constexpr auto options = ParseOptions::hardened();
    EXPECT_EQ(options.max_depth, 1000u);
    EXPECT_EQ(options.max_string_length, 8192u);
    EXPECT_EQ(options.max_array_size, 10000u);
    EXPECT_EQ(options.max_object_size, 10000u);
    EXPECT_EQ(options.max_total_size, 1048576u);
    EXPECT_DOUBLE_EQ(options.max_number_magnitude, 1e308);
    EXPECT_FALSE(options.allow_comments);

    EXPECT_EQ(error_of(R"(")" + std::string(8193, 'x') + R"(")", options),
              ParseError::max_string_length_exceeded);
}

// -- Error locations ----------------------------------------------------------

TEST(ParseLocation, reports_line_and_column) {
    const auto text = std::string_view{"{\n  \"a\": 1,\n  \"b\" 2\n}"};
    auto result = parse(text);
    EXPECT_EQ(result.error, ParseError::miss_colon);
    EXPECT_EQ(result.location.line, 3u);
    EXPECT_EQ(result.location.column, 7u);
    EXPECT_EQ(result.location.offset, 18u);
}

TEST(ParseLocation, describe_shows_line_and_caret) {
    const auto text = std::string_view{"[1,\n 2 3]"};
    auto result = parse(text);
    ASSERT_EQ(result.error, ParseError::miss_comma_or_square_bracket);
    EXPECT_EQ(describe(result, text),
              "miss_comma_or_square_bracket at line 2, column 4\n"
              " 2 3]\n"
              "   ^");
}

TEST(ParseLocation, describe_success_is_ok) {
    const auto text = std::string_view{"[]"};
    EXPECT_EQ(describe(parse(text), text), "ok");
}
