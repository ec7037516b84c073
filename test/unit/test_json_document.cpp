#include "tamper/core/json_document.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using tamper::error_code;
using namespace tamper::payload;

namespace {

const char* kNested = R"({"a":{"b":"text","n":1.50,"o":{"k":true}},"list":[1,2]})";

} // namespace

TEST(JsonDocument, ParsesAndSerializesCompactly) {
    auto doc = tamper::json_document::parse(R"({ "x" : [ 1 , 2 ] })");
    ASSERT_TRUE(doc.has_value());
    EXPECT_FALSE(doc->is_root_array());
    EXPECT_EQ(doc->to_string(), R"({"x":[1,2]})");
}

TEST(JsonDocument, InsertRootRequiresObject) {
    auto doc = tamper::json_document::parse("[1]");
    ASSERT_TRUE(doc.has_value());
    auto inserted = doc->insert_root("k", tamper::json::json_value::string_node("v"));
    ASSERT_FALSE(inserted.has_value());
    EXPECT_EQ(inserted.error(), error_code::not_an_object);
}

TEST(Payload, NotSetIsCaseInsensitive) {
    EXPECT_TRUE(is_not_set("NOT_SET"));
    EXPECT_TRUE(is_not_set("not_set"));
    EXPECT_FALSE(is_not_set("NOT SET"));
    EXPECT_FALSE(is_not_set(""));
}

TEST(Payload, ValidJsonNeedsStructure) {
    EXPECT_TRUE(is_valid_json(R"({"a":1})"));
    EXPECT_TRUE(is_valid_json("[1]"));
    EXPECT_FALSE(is_valid_json(R"("text")"));
    EXPECT_FALSE(is_valid_json("42"));
    EXPECT_FALSE(is_valid_json("{a:1}"));
    EXPECT_FALSE(is_valid_json(R"({"a":1} trailing)"));
}

TEST(Payload, RootArrayDetection) {
    EXPECT_TRUE(is_root_array(R"([{"a":1}])"));
    EXPECT_FALSE(is_root_array(R"({"a":[1]})"));
    EXPECT_FALSE(is_root_array("{"));
}

TEST(Payload, TypeTestsOnObjects) {
    EXPECT_EQ(is_primitive(kNested, "a#b"), true);
    EXPECT_EQ(is_primitive(kNested, "a#o"), false);
    EXPECT_EQ(is_object(kNested, "a#o"), true);
    EXPECT_EQ(is_object(kNested, "list"), true);
    EXPECT_EQ(is_object(kNested, "a#n"), false);
    EXPECT_EQ(is_array(kNested, "list"), true);
    EXPECT_EQ(is_array(kNested, "a"), false);
}

TEST(Payload, MissingPathFoldsToFalse) {
    EXPECT_EQ(is_primitive(kNested, "a#missing"), false);
    EXPECT_EQ(is_object(kNested, "a#missing"), false);
    EXPECT_EQ(is_array(kNested, "missing#deeper"), false);
}

TEST(Payload, MalformedPathFoldsOnlyForObjectAndArray) {
    auto primitive = is_primitive(kNested, "a#first name");
    ASSERT_FALSE(primitive.has_value());
    EXPECT_EQ(primitive.error(), error_code::malformed_path);

    EXPECT_EQ(is_object(kNested, "a#first name"), false);
    EXPECT_EQ(is_array(kNested, "a#first name"), false);
}

TEST(Payload, MalformedPayloadIsReported) {
    for (const char* payload : {"{", "{a:1}"}) {
        auto primitive = is_primitive(payload, "a");
        auto object = is_object(payload, "a");
        auto array = is_array(payload, "a");
        ASSERT_FALSE(primitive.has_value()) << payload;
        ASSERT_FALSE(object.has_value()) << payload;
        ASSERT_FALSE(array.has_value()) << payload;
        EXPECT_EQ(primitive.error(), error_code::malformed_json);
        EXPECT_EQ(object.error(), error_code::malformed_json);
        EXPECT_EQ(array.error(), error_code::malformed_json);
    }
}

TEST(Payload, TypeTestsAddressFirstElementOfRootArray) {
    const char* payload = R"([{"tags":["x"],"name":"n"},{"tags":"y"}])";
    EXPECT_EQ(is_array(payload, "tags"), true);
    EXPECT_EQ(is_primitive(payload, "name"), true);
    EXPECT_EQ(is_primitive(payload, "$[0]#name"), true);
    EXPECT_EQ(is_object(payload, "tags"), true);
}

TEST(Payload, ReadField) {
    EXPECT_EQ(read_field(kNested, "a#b"), "text");
    EXPECT_EQ(read_field(kNested, "a.n"), "1.50");
    EXPECT_EQ(read_field(kNested, "a#o"), R"({"k":true})");
    EXPECT_EQ(read_field(kNested, "list"), "[1,2]");
    EXPECT_EQ(read_field(kNested, "a.keys()"), R"(["b","n","o"])");
    EXPECT_EQ(read_field(R"({"items":[{"id":1},{"id":2}]})", "items[*].id"), "[1,2]");
}

TEST(Payload, ReadFieldFallsBackToNotSet) {
    EXPECT_EQ(read_field(kNested, "a#missing"), not_set);
    EXPECT_EQ(read_field(kNested, "a#first name"), not_set);
    EXPECT_EQ(read_field("{", "a"), not_set);
}

TEST(Payload, FieldPresence) {
    EXPECT_TRUE(is_field_present(kNested, "a#o#k"));
    EXPECT_FALSE(is_field_present(kNested, "a#o#z"));
}

TEST(Payload, NonEmptyMap) {
    const char* payload = R"({"m":{"a":1},"e":{},"s":"x"})";
    EXPECT_TRUE(is_valid_non_empty_map(payload, "m"));
    EXPECT_FALSE(is_valid_non_empty_map(payload, "e"));
    EXPECT_FALSE(is_valid_non_empty_map(payload, "s"));
    EXPECT_FALSE(is_valid_non_empty_map(payload, "missing"));
}

TEST(Payload, EraseField) {
    EXPECT_EQ(erase_field(R"({"a":1,"b":{"c":2}})", "b#c"), R"({"a":1,"b":{}})");
    EXPECT_EQ(erase_field(R"([{"a":1,"b":2}])", "$[0]#a"), R"([{"b":2}])");
    EXPECT_EQ(erase_field("  ", "a"), "  ");
}

TEST(Payload, UnresolvableReadsAndErasesLeavePayloadAlone) {
    const std::string payload = R"({ "a" : { "b" : [ 1 ] } })";
    for (const char* path : {"x", "a#x", "a#b#c", "a#b[5]", "a b", "a..b"}) {
        EXPECT_TRUE(is_not_set(read_field(payload, path))) << path;
        EXPECT_EQ(erase_field(payload, path), payload) << path;
    }
}

TEST(Payload, SetFieldReplacesWithPermissiveValue) {
    auto replaced = set_field(R"({"a":{"b":1}})", "$.a", "{'x': 1}");
    ASSERT_TRUE(replaced.has_value());
    EXPECT_EQ(*replaced, R"({"a":{"x":1}})");

    auto missing = set_field(R"({"a":{}})", "$.a.b", "1");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), error_code::path_not_found);

    auto broken = set_field("{", "$.a", "1");
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error(), error_code::malformed_json);
}

TEST(Payload, ReplaceFieldAddressesEveryRootElement) {
    EXPECT_EQ(replace_field(R"([{"arr":[1]},{"arr":[2]}])", "arr", R"("s")"),
              R"([{"arr":"s"},{"arr":"s"}])");
    EXPECT_EQ(replace_field(R"({"o":{"arr":[1]}})", "o#arr", "7"), R"({"o":{"arr":7}})");
}

TEST(Payload, ReplaceFieldReturnsOriginalOnFailure) {
    const std::string payload = R"({ "a": 1 })";
    EXPECT_EQ(replace_field(payload, "b", "2"), payload);
    EXPECT_EQ(replace_field(payload, "a", "{"), payload);

    const std::string elements = R"([ {"a": 1}, {"a": 2} ])";
    EXPECT_EQ(replace_field(elements, "b", "3"), elements);
}

TEST(Payload, InsertRootField) {
    EXPECT_EQ(insert_root_field(R"({"a":1})", "b", "x"), R"({"a":1,"b":"x"})");
    EXPECT_EQ(insert_root_field(R"({"b":1,"a":2})", "b", "x"), R"({"b":"x","a":2})");
    EXPECT_EQ(insert_root_field("[1]", "b", "x"), "[1]");
}

TEST(Payload, EmptyPayloads) {
    EXPECT_TRUE(is_empty_payload(std::nullopt));
    EXPECT_TRUE(is_empty_payload(""));
    EXPECT_TRUE(is_empty_payload("  {} "));
    EXPECT_TRUE(is_empty_payload(R"("{}")"));
    EXPECT_FALSE(is_empty_payload(R"({"a":1})"));
    EXPECT_FALSE(is_empty_payload("[]"));
}

TEST(Payload, EqualAsJsonUsesCanonicalForm) {
    EXPECT_TRUE(equal_as_json(R"({"a":1,"b":[1,2]})", R"({ "b" : [1, 2], "a" : 1 })"));
    EXPECT_TRUE(equal_as_json(R"({"o":{"y":1,"x":2}})", R"({"o":{"x":2,"y":1}})"));
    EXPECT_FALSE(equal_as_json("[1,2]", "[2,1]"));
    EXPECT_FALSE(equal_as_json(R"({"a":1.0})", R"({"a":1})"));
    EXPECT_FALSE(equal_as_json("", ""));
    EXPECT_FALSE(equal_as_json("{", "{"));
}

TEST(Payload, DiagnosticsGoToConfiguredHandler) {
    std::vector<std::string> events;
    tamper::engine_config cfg;
    cfg.trace = [&](const tamper::trace_event& e) {
        events.push_back(std::string(e.component) + ": " + e.message);
    };

    EXPECT_EQ(read_field(kNested, "a#missing", cfg), not_set);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], "json: expected variable a#missing was not found, setting to NOT_SET");

    EXPECT_EQ(replace_field(kNested, "nope", "1", cfg), kNested);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].rfind("json: could not replace nope", 0), 0u);
}

TEST(Payload, DefaultConfigIsSilent) {
    const auto& cfg = tamper::default_engine_config();
    EXPECT_FALSE(static_cast<bool>(cfg.trace));
    EXPECT_EQ(cfg.strict.mode, tamper::json::grammar::strict);
    EXPECT_EQ(cfg.permissive.mode, tamper::json::grammar::permissive);
    EXPECT_TRUE(static_cast<bool>(tamper::stderr_trace_handler()));
}
