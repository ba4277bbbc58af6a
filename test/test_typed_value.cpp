// test_typed_value.cpp - Tests for wire value encoding and list key rendering

#include <catch2/catch_all.hpp>
#include <ydelta/errors.h>
#include <ydelta/keys.h>
#include <ydelta/typed_value.h>

#include "test_schemas.h"

#include <string>

using namespace ydelta;
using namespace test_schemas;

// ============================================================
// Helper Functions
// ============================================================

namespace {

DiffErrorCode error_code_of(auto&& fn) {
    try {
        fn();
    } catch (const DiffError& e) {
        return e.code();
    }
    return DiffErrorCode::Success;
}

} // namespace

// ============================================================
// Encoding
// ============================================================

TEST_CASE("encode_typed_value scalars", "[typed_value][encode]") {
    SECTION("string") {
        REQUIRE(encode_typed_value(LeafValue{"eth0"}) == TypedValue{"eth0"});
    }

    SECTION("signed integers become int_val") {
        REQUIRE(encode_typed_value(LeafValue{int8_t{-3}}) == TypedValue{std::int64_t{-3}});
        REQUIRE(encode_typed_value(LeafValue{int32_t{42}}) == TypedValue{std::int64_t{42}});
    }

    SECTION("unsigned integers become uint_val") {
        REQUIRE(encode_typed_value(LeafValue{uint16_t{1500}}) == TypedValue{std::uint64_t{1500}});
        REQUIRE(encode_typed_value(LeafValue{uint64_t{7}}) == TypedValue{std::uint64_t{7}});
    }

    SECTION("floating point and bool") {
        REQUIRE(encode_typed_value(LeafValue{1.5f}) == TypedValue{1.5f});
        REQUIRE(encode_typed_value(LeafValue{2.25}) == TypedValue{2.25});
        REQUIRE(encode_typed_value(LeafValue{true}) == TypedValue{true});
    }

    SECTION("binary") {
        Binary data{0x01, 0x02, 0xff};
        REQUIRE(encode_typed_value(LeafValue{data}) == TypedValue{TypedValue::bytes{0x01, 0x02, 0xff}});
    }

    SECTION("enumeration uses its name") {
        REQUIRE(encode_typed_value(LeafValue::enumeration(example_enum, 2)) == TypedValue{"TWO"});
    }

    SECTION("union is unwrapped") {
        REQUIRE(encode_typed_value(LeafValue::union_of(LeafValue{"hello"})) == TypedValue{"hello"});
        REQUIRE(encode_typed_value(LeafValue::union_of(LeafValue{uint32_t{5}})) ==
                TypedValue{std::uint64_t{5}});
    }

    SECTION("leaf-list becomes leaflist_val") {
        auto encoded = encode_typed_value(LeafValue::leaf_list({uint64_t{1}, uint64_t{2}}));
        const auto* arr = encoded.get_if<ScalarArray>();
        REQUIRE(arr != nullptr);
        REQUIRE(arr->element.size() == 2);
        REQUIRE(arr->element[1] == TypedValue{std::uint64_t{2}});
        REQUIRE(typed_value_to_string(encoded) == "leaflist_val:[uint_val:1 uint_val:2]");
    }
}

TEST_CASE("encode_typed_value failures", "[typed_value][encode][error]") {
    SECTION("unset value") {
        REQUIRE(error_code_of([] { (void)encode_typed_value(LeafValue{}); }) ==
                DiffErrorCode::ValueEncodingFailure);
    }

    SECTION("enum value with no name") {
        try {
            (void)encode_typed_value(LeafValue::enumeration(example_enum, 42));
            FAIL("expected DiffError");
        } catch (const DiffError& e) {
            REQUIRE(e.code() == DiffErrorCode::ValueEncodingFailure);
            REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("no enum name mapping for value 42"));
            REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("EnumType"));
        }
    }
}

TEST_CASE("typed_value_to_string", "[typed_value]") {
    REQUIRE(typed_value_to_string(TypedValue{"x"}) == "string_val:\"x\"");
    REQUIRE(typed_value_to_string(TypedValue{std::int64_t{-1}}) == "int_val:-1");
    REQUIRE(typed_value_to_string(TypedValue{false}) == "bool_val:false");
    REQUIRE(typed_value_to_string(TypedValue{}) == "<nil>");
}

// ============================================================
// Decoding
// ============================================================

TEST_CASE("decode_typed_value", "[typed_value][decode]") {
    const auto& fields = render_example;

    SECTION("string") {
        REQUIRE(decode_typed_value(TypedValue{"abc"}, *fields.field("str")) == LeafValue{"abc"});
    }

    SECTION("narrow integer") {
        REQUIRE(decode_typed_value(TypedValue{std::int64_t{-7}}, *fields.field("int-val")) ==
                LeafValue{int32_t{-7}});
    }

    SECTION("integer out of range") {
        const auto* mtu = shadow_example.field("mtu");
        REQUIRE(error_code_of([&] { (void)decode_typed_value(TypedValue{std::uint64_t{70000}}, *mtu); }) ==
                DiffErrorCode::ValueDecodingFailure);
    }

    SECTION("wrong wire type") {
        REQUIRE(error_code_of([&] { (void)decode_typed_value(TypedValue{true}, *fields.field("str")); }) ==
                DiffErrorCode::ValueDecodingFailure);
    }

    SECTION("enumeration by name") {
        REQUIRE(decode_typed_value(TypedValue{"ONE"}, *fields.field("enum")) ==
                LeafValue::enumeration(example_enum, 1));
        REQUIRE(error_code_of([&] { (void)decode_typed_value(TypedValue{"THREE"}, *fields.field("enum")); }) ==
                DiffErrorCode::ValueDecodingFailure);
    }

    SECTION("leaf-list") {
        ScalarArray arr{{TypedValue{std::uint64_t{3}}, TypedValue{std::uint64_t{4}}}};
        REQUIRE(decode_typed_value(TypedValue{arr}, *fields.field("leaf-list")) ==
                LeafValue::leaf_list({uint64_t{3}, uint64_t{4}}));
    }

    SECTION("union string member") {
        REQUIRE(decode_typed_value(TypedValue{"u"}, *fields.field("union")) ==
                LeafValue::union_of(LeafValue{"u"}));
    }

    SECTION("container is not a leaf") {
        REQUIRE(error_code_of([&] { (void)decode_typed_value(TypedValue{"x"}, *fields.field("ch")); }) ==
                DiffErrorCode::ValueDecodingFailure);
    }
}

// ============================================================
// List keys
// ============================================================

TEST_CASE("key_value_as_string", "[keys]") {
    SECTION("supported key types") {
        REQUIRE(key_value_as_string(LeafValue{"eth0"}) == "eth0");
        REQUIRE(key_value_as_string(LeafValue{int32_t{-12}}) == "-12");
        REQUIRE(key_value_as_string(LeafValue{uint64_t{42}}) == "42");
        REQUIRE(key_value_as_string(LeafValue{2.5}) == "2.5");
        REQUIRE(key_value_as_string(LeafValue{true}) == "true");
        REQUIRE(key_value_as_string(LeafValue::enumeration(example_enum, 1)) == "ONE");
        REQUIRE(key_value_as_string(LeafValue::union_of(LeafValue{"member"})) == "member");
        REQUIRE(key_value_as_string(LeafValue{Binary{'a', 'b', 'c'}}) == "YWJj");
    }

    SECTION("float keys are rejected") {
        REQUIRE(error_code_of([] { (void)key_value_as_string(LeafValue{1.5f}); }) ==
                DiffErrorCode::KeyStringFailure);
    }

    SECTION("unset and unnamed values are rejected") {
        REQUIRE(error_code_of([] { (void)key_value_as_string(LeafValue{}); }) ==
                DiffErrorCode::KeyStringFailure);
        REQUIRE(error_code_of([] { (void)key_value_as_string(LeafValue::enumeration(example_enum, 9)); }) ==
                DiffErrorCode::KeyStringFailure);
    }
}

TEST_CASE("key_strings of list entries", "[keys]") {
    SECTION("multiple keys") {
        auto keys = key_strings(multikeyed("foo", 42, "v"));
        REQUIRE(keys.size() == 2);
        REQUIRE(keys.at("key1") == "foo");
        REQUIRE(keys.at("key2") == "42");
        REQUIRE(list_key_string(multikeyed("foo", 42, "v")) == "[key1=foo][key2=42]");
    }

    SECTION("missing key") {
        Record entry = RecordBuilder(multikeyed_entry).set("key1", "foo").finish();
        REQUIRE(error_code_of([&] { (void)key_strings(entry); }) == DiffErrorCode::InvalidKeyMap);
    }

    SECTION("record that is not a list entry") {
        REQUIRE(error_code_of([] { (void)key_strings(Record{render_example}); }) ==
                DiffErrorCode::InvalidKeyMap);
    }

    SECTION("float key") {
        Record entry = RecordBuilder(float_key_entry).set("weight", 0.5f).finish();
        REQUIRE(error_code_of([&] { (void)key_strings(entry); }) == DiffErrorCode::KeyStringFailure);
    }
}

TEST_CASE("key_value_from_string", "[keys]") {
    SECTION("inverse of key_value_as_string") {
        REQUIRE(key_value_from_string("42", *multikeyed_entry.field("key2")) == LeafValue{uint64_t{42}});
        REQUIRE(key_value_from_string("foo", *multikeyed_entry.field("key1")) == LeafValue{"foo"});
        REQUIRE(key_value_from_string("7", *list_entry.field("val")) == LeafValue{int32_t{7}});
    }

    SECTION("invalid numbers") {
        const auto* key2 = multikeyed_entry.field("key2");
        REQUIRE(error_code_of([&] { (void)key_value_from_string("4x", *key2); }) ==
                DiffErrorCode::ValueDecodingFailure);
        REQUIRE(error_code_of([&] { (void)key_value_from_string("-1", *key2); }) ==
                DiffErrorCode::ValueDecodingFailure);
    }
}

TEST_CASE("base64", "[keys][base64]") {
    REQUIRE(base64_encode(Binary{}) == "");
    REQUIRE(base64_encode(Binary{'a'}) == "YQ==");
    REQUIRE(base64_encode(Binary{'a', 'b'}) == "YWI=");
    REQUIRE(base64_decode("YWJj") == Binary{'a', 'b', 'c'});
    REQUIRE(base64_decode("YQ==") == Binary{'a'});
    REQUIRE(base64_decode(base64_encode(Binary{0x00, 0xff, 0x10, 0x20})) == Binary{0x00, 0xff, 0x10, 0x20});
}
