// json_test.cpp: nlohmann/json interoperability and the RFC 6902 wire codec

#include <jsonpatch-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace jp = jsonpatch_cpp;
using json = nlohmann::json;

namespace {

auto ptr(std::string_view text) -> jp::Pointer { return jp::Pointer::parse(text).value(); }

auto decode_error(const json& record) -> jp::ErrorKind {
    auto op = jp::operation_from_json(record);
    EXPECT_FALSE(op.has_value());
    return op ? jp::ErrorKind::diff_failed : op.error().kind;
}

}  // anonymous namespace

// =============================================================================
// Value <-> json
// =============================================================================

TEST(JsonValue, scalars_to_json) {
    EXPECT_EQ(json(jp::Value{}), json(nullptr));
    EXPECT_EQ(json(jp::Value{true}), json(true));
    EXPECT_EQ(json(jp::Value{-7}), json(-7));
    EXPECT_EQ(json(jp::Value{2.5}), json(2.5));
    EXPECT_EQ(json(jp::Value{"hi"}), json("hi"));
}

TEST(JsonValue, containers_to_json) {
    const auto v = jp::Value{jp::Object{
        {"list", jp::Array{1, "two", nullptr}},
        {"nested", jp::Object{{"flag", false}}},
    }};
    EXPECT_EQ(json(v), json::parse(R"({"list":[1,"two",null],"nested":{"flag":false}})"));
}

TEST(JsonValue, from_json_builds_value) {
    auto j = json::parse(R"({"a":[1,2.5,"s",true,null],"b":{}})");
    auto v = j.get<jp::Value>();
    EXPECT_EQ(v, (jp::Value{jp::Object{
        {"a", jp::Array{1, 2.5, "s", true, nullptr}},
        {"b", jp::Object{}},
    }}));
}

TEST(JsonValue, unsigned_within_int64_becomes_integer) {
    auto v = jp::value_from_json(json(std::uint64_t{5}));
    ASSERT_TRUE(v.has_value());
    EXPECT_NE(v->get_if<std::int64_t>(), nullptr);
}

TEST(JsonValue, large_unsigned_is_preserved) {
    const auto big = std::numeric_limits<std::uint64_t>::max();
    auto v = jp::value_from_json(json(big));
    ASSERT_TRUE(v.has_value());
    ASSERT_NE(v->get_if<std::uint64_t>(), nullptr);
    EXPECT_EQ(*v->get_if<std::uint64_t>(), big);
    EXPECT_EQ(json(*v), json(big));
}

TEST(JsonValue, binary_is_not_encodable) {
    auto v = jp::value_from_json(json::binary({0x01, 0x02}));
    ASSERT_FALSE(v.has_value());
    EXPECT_EQ(v.error().kind, jp::ErrorKind::not_encodable);
}

TEST(JsonValue, from_json_throws_on_binary) {
    auto j = json::binary({0x01});
    EXPECT_THROW((void)j.get<jp::Value>(), std::runtime_error);
}

TEST(JsonValue, parse_json_text) {
    auto ok = jp::parse_json_text(R"({"k": [1, 2]})");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, json::parse(R"({"k":[1,2]})"));

    auto bad = jp::parse_json_text("{\"k\": ");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind, jp::ErrorKind::invalid_json);
}

// =============================================================================
// Operation records
// =============================================================================

TEST(JsonOperation, encodes_each_verb) {
    EXPECT_EQ(json(jp::Operation{jp::OpAdd{.path = ptr("/a"), .value = 1}}),
              json::parse(R"({"op":"add","path":"/a","value":1})"));
    EXPECT_EQ(json(jp::Operation{jp::OpRemove{.path = ptr("/a~1b")}}),
              json::parse(R"({"op":"remove","path":"/a~1b"})"));
    EXPECT_EQ(json(jp::Operation{jp::OpReplace{.path = ptr(""), .value = jp::Array{}}}),
              json::parse(R"({"op":"replace","path":"","value":[]})"));
    EXPECT_EQ(json(jp::Operation{jp::OpMove{.from = ptr("/a"), .to = ptr("/b")}}),
              json::parse(R"({"op":"move","from":"/a","to":"/b"})"));
    EXPECT_EQ(json(jp::Operation{jp::OpCopy{.from = ptr("/a"), .to = ptr("/b")}}),
              json::parse(R"({"op":"copy","from":"/a","to":"/b"})"));
    EXPECT_EQ(json(jp::Operation{jp::OpTest{.path = ptr("/t"), .value = "v"}}),
              json::parse(R"({"op":"test","path":"/t","value":"v"})"));
}

TEST(JsonOperation, decodes_each_verb) {
    auto add = jp::operation_from_json(json::parse(R"({"op":"add","path":"/a","value":[1]})"));
    ASSERT_TRUE(add.has_value());
    EXPECT_EQ(*add, (jp::Operation{jp::OpAdd{.path = ptr("/a"), .value = jp::Array{1}}}));

    auto remove = jp::operation_from_json(json::parse(R"({"op":"remove","path":"/a/0"})"));
    ASSERT_TRUE(remove.has_value());
    EXPECT_EQ(*remove, jp::Operation{jp::OpRemove{.path = ptr("/a/0")}});

    auto move = jp::operation_from_json(json::parse(R"({"op":"move","from":"/a","to":"/b"})"));
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(*move, (jp::Operation{jp::OpMove{.from = ptr("/a"), .to = ptr("/b")}}));

    auto test = jp::operation_from_json(json::parse(R"({"op":"test","path":"","value":null})"));
    ASSERT_TRUE(test.has_value());
    EXPECT_EQ(*test, (jp::Operation{jp::OpTest{.path = ptr(""), .value = nullptr}}));
}

TEST(JsonOperation, rfc_path_accepted_as_target) {
    auto copy = jp::operation_from_json(json::parse(R"({"op":"copy","from":"/a","path":"/b"})"));
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(*copy, (jp::Operation{jp::OpCopy{.from = ptr("/a"), .to = ptr("/b")}}));
}

TEST(JsonOperation, to_wins_over_path) {
    auto move = jp::operation_from_json(
        json::parse(R"({"op":"move","from":"/a","to":"/b","path":"/c"})"));
    ASSERT_TRUE(move.has_value());
    EXPECT_EQ(*move, (jp::Operation{jp::OpMove{.from = ptr("/a"), .to = ptr("/b")}}));
}

TEST(JsonOperation, ignores_unknown_fields) {
    auto op = jp::operation_from_json(
        json::parse(R"({"op":"remove","path":"/a","comment":"cleanup"})"));
    ASSERT_TRUE(op.has_value());
    EXPECT_EQ(*op, jp::Operation{jp::OpRemove{.path = ptr("/a")}});
}

TEST(JsonOperation, malformed_records) {
    using jp::ErrorKind;
    EXPECT_EQ(decode_error(json::parse("[]")), ErrorKind::malformed_operation);
    EXPECT_EQ(decode_error(json::parse(R"({"path":"/a"})")), ErrorKind::malformed_operation);
    EXPECT_EQ(decode_error(json::parse(R"({"op":1,"path":"/a"})")), ErrorKind::malformed_operation);
    EXPECT_EQ(decode_error(json::parse(R"({"op":"add","value":1})")), ErrorKind::malformed_operation);
    EXPECT_EQ(decode_error(json::parse(R"({"op":"add","path":"/a"})")), ErrorKind::malformed_operation);
    EXPECT_EQ(decode_error(json::parse(R"({"op":"remove","path":7})")), ErrorKind::malformed_operation);
    EXPECT_EQ(decode_error(json::parse(R"({"op":"move","to":"/b"})")), ErrorKind::malformed_operation);
    EXPECT_EQ(decode_error(json::parse(R"({"op":"copy","from":"/a"})")), ErrorKind::malformed_operation);
}

TEST(JsonOperation, null_value_is_present) {
    auto op = jp::operation_from_json(json::parse(R"({"op":"add","path":"/a","value":null})"));
    ASSERT_TRUE(op.has_value());
    EXPECT_EQ(*op, (jp::Operation{jp::OpAdd{.path = ptr("/a"), .value = nullptr}}));
}

TEST(JsonOperation, unknown_verb) {
    auto op = jp::operation_from_json(json::parse(R"({"op":"frobnicate","path":"/a"})"));
    ASSERT_FALSE(op.has_value());
    EXPECT_EQ(op.error().kind, jp::ErrorKind::unknown_operation);
    EXPECT_NE(op.error().message.find("frobnicate"), std::string::npos);
}

TEST(JsonOperation, bad_pointer_text) {
    EXPECT_EQ(decode_error(json::parse(R"({"op":"remove","path":"a"})")),
              jp::ErrorKind::malformed_pointer);
    EXPECT_EQ(decode_error(json::parse(R"({"op":"remove","path":"/a~2"})")),
              jp::ErrorKind::malformed_pointer);
}

// =============================================================================
// Patch documents
// =============================================================================

TEST(JsonPatchDocument, must_be_array) {
    auto ops = jp::patch_from_json(json::parse(R"({"op":"remove","path":"/a"})"));
    ASSERT_FALSE(ops.has_value());
    EXPECT_EQ(ops.error().kind, jp::ErrorKind::malformed_operation);
}

TEST(JsonPatchDocument, first_bad_record_fails_whole_patch) {
    auto ops = jp::patch_from_json(json::parse(
        R"([{"op":"remove","path":"/a"},{"op":"nope","path":"/b"}])"));
    ASSERT_FALSE(ops.has_value());
    EXPECT_EQ(ops.error().kind, jp::ErrorKind::unknown_operation);
    EXPECT_EQ(ops.error().message.rfind("operation 1: ", 0), 0u) << ops.error().message;
}

TEST(JsonPatchDocument, encode_then_decode) {
    const auto original = json::parse(R"([
        {"op":"test","path":"/a","value":{"x":[1,2]}},
        {"op":"add","path":"/b/-","value":"z"},
        {"op":"move","from":"/a","to":"/c"}
    ])");
    auto ops = jp::patch_from_json(original);
    ASSERT_TRUE(ops.has_value());
    ASSERT_EQ(ops->size(), 3u);
    EXPECT_EQ(jp::patch_to_json(*ops), original);
}

TEST(JsonPatchDocument, empty_patch) {
    auto ops = jp::patch_from_json(json::array());
    ASSERT_TRUE(ops.has_value());
    EXPECT_TRUE(ops->empty());
    EXPECT_EQ(jp::patch_to_json(*ops), json::array());
}

// =============================================================================
// diff_json_patch / apply_json_patch
// =============================================================================

TEST(JsonDiff, object_add_and_remove) {
    auto patch = jp::diff_json_patch(json::parse(R"({"a":1})"), json::parse(R"({"b":2})"));
    ASSERT_TRUE(patch.has_value());
    EXPECT_EQ(*patch, json::parse(
        R"([{"op":"remove","path":"/a"},{"op":"add","path":"/b","value":2}])"));

    auto patched = jp::apply_json_patch(json::parse(R"({"a":1})"), *patch);
    ASSERT_TRUE(patched.has_value());
    EXPECT_EQ(*patched, json::parse(R"({"b":2})"));
}

TEST(JsonDiff, nested_replace) {
    auto patch = jp::diff_json_patch(json::parse(R"({"a":{"b":1}})"),
                                     json::parse(R"({"a":{"b":2}})"));
    ASSERT_TRUE(patch.has_value());
    EXPECT_EQ(*patch, json::parse(R"([{"op":"replace","path":"/a/b","value":2}])"));
}

TEST(JsonDiff, list_length_change_replaces_list) {
    auto patch = jp::diff_json_patch(json::parse(R"({"a":[1,2]})"),
                                     json::parse(R"({"a":[1,2,3]})"));
    ASSERT_TRUE(patch.has_value());
    EXPECT_EQ(*patch, json::parse(R"([{"op":"replace","path":"/a","value":[1,2,3]}])"));
}

TEST(JsonDiff, unconvertible_input_fails) {
    auto patch = jp::diff_json_patch(json::binary({0x01}), json::object());
    ASSERT_FALSE(patch.has_value());
    EXPECT_EQ(patch.error().kind, jp::ErrorKind::diff_failed);
}

TEST(JsonApply, strict_and_lenient_remove_of_absent_key) {
    const auto patch = json::parse(R"([{"op":"remove","path":"/x"}])");

    auto strict = jp::apply_json_patch(json::object(), patch);
    ASSERT_FALSE(strict.has_value());
    ASSERT_FALSE(jp::is_test_failure(strict.error()));
    EXPECT_EQ(std::get<jp::Error>(strict.error()).kind, jp::ErrorKind::missing_key);

    auto lenient = jp::apply_json_patch(json::object(), patch, false);
    ASSERT_TRUE(lenient.has_value());
    EXPECT_EQ(*lenient, json::object());
}

TEST(JsonApply, test_failure_halts) {
    auto result = jp::apply_json_patch(
        json::parse(R"({"a":1})"),
        json::parse(R"([{"op":"test","path":"/a","value":2},{"op":"add","path":"/b","value":3}])"));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(jp::is_test_failure(result.error()));
}

TEST(JsonApply, append_with_dash) {
    auto result = jp::apply_json_patch(
        json::parse(R"({"a":[1,2]})"),
        json::parse(R"([{"op":"add","path":"/a/-","value":3}])"));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, json::parse(R"({"a":[1,2,3]})"));
}

TEST(JsonApply, rfc6902_appendix_a_examples) {
    struct Case {
        const char* doc;
        const char* patch;
        const char* expected;
    };
    const auto cases = std::vector<Case>{
        {R"({"foo":"bar"})",
         R"([{"op":"add","path":"/baz","value":"qux"}])",
         R"({"baz":"qux","foo":"bar"})"},
        {R"({"foo":["bar","baz"]})",
         R"([{"op":"add","path":"/foo/1","value":"qux"}])",
         R"({"foo":["bar","qux","baz"]})"},
        {R"({"baz":"qux","foo":"bar"})",
         R"([{"op":"remove","path":"/baz"}])",
         R"({"foo":"bar"})"},
        {R"({"foo":["bar","qux","baz"]})",
         R"([{"op":"remove","path":"/foo/1"}])",
         R"({"foo":["bar","baz"]})"},
        {R"({"baz":"qux","foo":"bar"})",
         R"([{"op":"replace","path":"/baz","value":"boo"}])",
         R"({"baz":"boo","foo":"bar"})"},
        {R"({"foo":{"bar":"baz","waldo":"fred"},"qux":{"corge":"grault"}})",
         R"([{"op":"move","from":"/foo/waldo","path":"/qux/thud"}])",
         R"({"foo":{"bar":"baz"},"qux":{"corge":"grault","thud":"fred"}})"},
        {R"({"foo":["all","grass","cows","eat"]})",
         R"([{"op":"move","from":"/foo/1","path":"/foo/3"}])",
         R"({"foo":["all","cows","eat","grass"]})"},
        {R"({"baz":"qux","foo":["a",2,"c"]})",
         R"([{"op":"test","path":"/baz","value":"qux"},{"op":"test","path":"/foo/1","value":2}])",
         R"({"baz":"qux","foo":["a",2,"c"]})"},
        {R"({"foo":"bar"})",
         R"([{"op":"add","path":"/child","value":{"grandchild":{}}}])",
         R"({"foo":"bar","child":{"grandchild":{}}})"},
        {R"({"/":9,"~1":10})",
         R"([{"op":"test","path":"/~01","value":10}])",
         R"({"/":9,"~1":10})"},
        {R"({"foo":["bar"]})",
         R"([{"op":"add","path":"/foo/-","value":["abc","def"]}])",
         R"({"foo":["bar",["abc","def"]]})"},
    };

    for (const auto& c : cases) {
        auto result = jp::apply_json_patch(json::parse(c.doc), json::parse(c.patch));
        ASSERT_TRUE(result.has_value()) << c.patch << ": " << jp::describe(result.error());
        EXPECT_EQ(*result, json::parse(c.expected)) << c.patch;
    }
}

TEST(JsonApply, rfc6902_appendix_a_errors) {
    auto missing_parent = jp::apply_json_patch(
        json::parse(R"({"foo":"bar"})"),
        json::parse(R"([{"op":"add","path":"/baz/bat","value":"qux"}])"));
    ASSERT_FALSE(missing_parent.has_value());
    EXPECT_EQ(std::get<jp::Error>(missing_parent.error()).kind, jp::ErrorKind::path_not_found);

    auto string_vs_number = jp::apply_json_patch(
        json::parse(R"({"/":9,"~1":10})"),
        json::parse(R"([{"op":"test","path":"/~01","value":"10"}])"));
    ASSERT_FALSE(string_vs_number.has_value());
    EXPECT_TRUE(jp::is_test_failure(string_vs_number.error()));

    auto bad_verb = jp::apply_json_patch(
        json::parse(R"({"foo":"bar"})"),
        json::parse(R"([{"op":"add","path":"/baz","value":"qux","op":"move"}])"));
    // nlohmann keeps the last duplicate key, turning this into a move without "from"
    ASSERT_FALSE(bad_verb.has_value());
    EXPECT_EQ(std::get<jp::Error>(bad_verb.error()).kind, jp::ErrorKind::malformed_operation);
}

TEST(JsonApply, decode_failure_is_reported_before_applying) {
    auto result = jp::apply_json_patch(json::object(), json::parse(R"([{"op":"add"}])"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(std::get<jp::Error>(result.error()).kind, jp::ErrorKind::malformed_operation);
}
