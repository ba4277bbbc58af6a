// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// typed_value.cpp - Leaf value <-> TypedValue conversions

#include <ydelta/typed_value.h>
#include <ydelta/errors.h>
#include <ydelta/keys.h>

#include <charconv>
#include <limits>
#include <sstream>
#include <type_traits>
#include <utility>

namespace ydelta {

// ============================================================
// Rendering
// ============================================================

namespace {

void append_typed(std::ostringstream& oss, const TypedValue& val)
{
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "<nil>";
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "string_val:\"" << v << '"';
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            oss << "int_val:" << v;
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            oss << "uint_val:" << v;
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << "bool_val:" << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, TypedValue::bytes>) {
            oss << "bytes_val:\"" << base64_encode(v) << '"';
        } else if constexpr (std::is_same_v<T, float>) {
            oss << "float_val:" << v;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << "double_val:" << v;
        } else if constexpr (std::is_same_v<T, ScalarArray>) {
            oss << "leaflist_val:[";
            for (std::size_t i = 0; i < v.element.size(); ++i) {
                if (i) oss << ' ';
                append_typed(oss, v.element[i]);
            }
            oss << ']';
        }
    }, val.value);
}

} // anonymous namespace

std::string typed_value_to_string(const TypedValue& val)
{
    std::ostringstream oss;
    append_typed(oss, val);
    return oss.str();
}

// ============================================================
// Encoding
// ============================================================

namespace {

TypedValue encode_scalar(const LeafValue& val, bool in_leaf_list)
{
    return std::visit([&](const auto& v) -> TypedValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            throw DiffError(DiffErrorCode::ValueEncodingFailure, "cannot encode an unset value");
        } else if constexpr (std::is_same_v<T, bool>) {
            return TypedValue{v};
        } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
            return TypedValue{static_cast<std::int64_t>(v)};
        } else if constexpr (std::is_integral_v<T>) {
            return TypedValue{static_cast<std::uint64_t>(v)};
        } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
            return TypedValue{v};
        } else if constexpr (std::is_same_v<T, std::string>) {
            return TypedValue{v};
        } else if constexpr (std::is_same_v<T, Binary>) {
            return TypedValue{TypedValue::bytes(v)};
        } else if constexpr (std::is_same_v<T, EnumValue>) {
            if (auto name = v.name()) {
                return TypedValue{*name};
            }
            throw DiffError(DiffErrorCode::ValueEncodingFailure,
                            "no enum name mapping for value " + std::to_string(v.value) +
                                (v.type ? " of " + v.type->name : std::string()));
        } else if constexpr (std::is_same_v<T, UnionValue>) {
            return encode_scalar(v.value.get(), in_leaf_list);
        } else {
            static_assert(std::is_same_v<T, LeafList>);
            if (in_leaf_list) {
                throw DiffError(DiffErrorCode::ValueEncodingFailure, "leaf-list cannot contain a leaf-list");
            }
            ScalarArray arr;
            arr.element.reserve(v.size());
            for (const auto& item : v) {
                arr.element.push_back(encode_scalar(item.get(), true));
            }
            return TypedValue{std::move(arr)};
        }
    }, val.data);
}

} // anonymous namespace

TypedValue encode_typed_value(const LeafValue& val)
{
    return encode_scalar(val, false);
}

// ============================================================
// Decoding
// ============================================================

namespace {

[[noreturn]] void decode_failure(const FieldDescriptor& field, std::string_view reason)
{
    throw DiffError(DiffErrorCode::ValueDecodingFailure,
                    "cannot decode value for field " + field.name + " of type " +
                        std::string(leaf_type_name(field.leaf_type)) + ": " + std::string(reason));
}

template <typename T>
LeafValue narrow_integer(auto v, const FieldDescriptor& field)
{
    if (!std::in_range<T>(v)) {
        decode_failure(field, std::to_string(v) + " is out of range");
    }
    return LeafValue{static_cast<T>(v)};
}

template <typename Wire>
const Wire& expect(const TypedValue& val, const FieldDescriptor& field, std::string_view wire_name)
{
    const auto* v = val.get_if<Wire>();
    if (!v) {
        decode_failure(field, "expected " + std::string(wire_name) + ", got " + typed_value_to_string(val));
    }
    return *v;
}

LeafValue decode_union_member(const TypedValue& val, const FieldDescriptor& field)
{
    return std::visit([&](const auto& v) -> LeafValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate> || std::is_same_v<T, ScalarArray>) {
            decode_failure(field, "unsupported union member " + typed_value_to_string(val));
        } else if constexpr (std::is_same_v<T, TypedValue::bytes>) {
            return LeafValue::union_of(LeafValue{Binary(v)});
        } else {
            return LeafValue::union_of(LeafValue{v});
        }
    }, val.value);
}

LeafValue decode_scalar(const TypedValue& val, const FieldDescriptor& field)
{
    switch (field.leaf_type) {
        case LeafType::String: return LeafValue{expect<std::string>(val, field, "string_val")};
        case LeafType::Int8:   return narrow_integer<int8_t>(expect<std::int64_t>(val, field, "int_val"), field);
        case LeafType::Int16:  return narrow_integer<int16_t>(expect<std::int64_t>(val, field, "int_val"), field);
        case LeafType::Int32:  return narrow_integer<int32_t>(expect<std::int64_t>(val, field, "int_val"), field);
        case LeafType::Int64:  return LeafValue{expect<std::int64_t>(val, field, "int_val")};
        case LeafType::Uint8:  return narrow_integer<uint8_t>(expect<std::uint64_t>(val, field, "uint_val"), field);
        case LeafType::Uint16: return narrow_integer<uint16_t>(expect<std::uint64_t>(val, field, "uint_val"), field);
        case LeafType::Uint32: return narrow_integer<uint32_t>(expect<std::uint64_t>(val, field, "uint_val"), field);
        case LeafType::Uint64: return LeafValue{expect<std::uint64_t>(val, field, "uint_val")};
        case LeafType::Float:  return LeafValue{expect<float>(val, field, "float_val")};
        case LeafType::Double:
            if (const auto* f = val.get_if<float>()) {
                return LeafValue{static_cast<double>(*f)};
            }
            return LeafValue{expect<double>(val, field, "double_val")};
        case LeafType::Bool:
        case LeafType::Empty:  return LeafValue{expect<bool>(val, field, "bool_val")};
        case LeafType::Binary: return LeafValue{Binary(expect<TypedValue::bytes>(val, field, "bytes_val"))};
        case LeafType::Enum: {
            const auto& name = expect<std::string>(val, field, "string_val");
            if (!field.enum_type) {
                decode_failure(field, "field has no enumeration table");
            }
            auto value = field.enum_type->value_of(name);
            if (!value) {
                decode_failure(field, "unknown enum name " + name + " for " + field.enum_type->name);
            }
            return LeafValue::enumeration(*field.enum_type, *value);
        }
        case LeafType::Union:  return decode_union_member(val, field);
    }
    decode_failure(field, "unknown leaf type");
}

} // anonymous namespace

LeafValue decode_typed_value(const TypedValue& val, const FieldDescriptor& field)
{
    if (!field.is_leaf()) {
        decode_failure(field, "field is not a leaf");
    }
    if (!field.leaf_list) {
        return decode_scalar(val, field);
    }

    const auto& arr = expect<ScalarArray>(val, field, "leaflist_val");
    auto t = LeafList{}.transient();
    for (const auto& item : arr.element) {
        t.push_back(LeafBox{decode_scalar(item, field)});
    }
    return LeafValue{t.persistent()};
}

// ============================================================
// Key predicate parsing
// ============================================================

namespace {

template <typename T>
T parse_number(std::string_view text, const FieldDescriptor& field)
{
    T out{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        decode_failure(field, "'" + std::string(text) + "' is not a valid number");
    }
    return out;
}

} // anonymous namespace

LeafValue key_value_from_string(std::string_view text, const FieldDescriptor& field)
{
    switch (field.leaf_type) {
        case LeafType::String: return LeafValue{std::string(text)};
        case LeafType::Int8:   return narrow_integer<int8_t>(parse_number<std::int64_t>(text, field), field);
        case LeafType::Int16:  return narrow_integer<int16_t>(parse_number<std::int64_t>(text, field), field);
        case LeafType::Int32:  return narrow_integer<int32_t>(parse_number<std::int64_t>(text, field), field);
        case LeafType::Int64:  return LeafValue{parse_number<std::int64_t>(text, field)};
        case LeafType::Uint8:  return narrow_integer<uint8_t>(parse_number<std::uint64_t>(text, field), field);
        case LeafType::Uint16: return narrow_integer<uint16_t>(parse_number<std::uint64_t>(text, field), field);
        case LeafType::Uint32: return narrow_integer<uint32_t>(parse_number<std::uint64_t>(text, field), field);
        case LeafType::Uint64: return LeafValue{parse_number<std::uint64_t>(text, field)};
        case LeafType::Double: return LeafValue{parse_number<double>(text, field)};
        case LeafType::Bool:
            if (text == "true") return LeafValue{true};
            if (text == "false") return LeafValue{false};
            decode_failure(field, "'" + std::string(text) + "' is not a boolean");
        case LeafType::Binary: return LeafValue{base64_decode(text)};
        case LeafType::Enum: {
            auto value = field.enum_type ? field.enum_type->value_of(text) : std::nullopt;
            if (!value) {
                decode_failure(field, "unknown enum name " + std::string(text));
            }
            return LeafValue::enumeration(*field.enum_type, *value);
        }
        case LeafType::Union:  return LeafValue::union_of(LeafValue{std::string(text)});
        case LeafType::Float:
        case LeafType::Empty:
            break;
    }
    decode_failure(field, "type cannot be used as a list key");
}

} // namespace ydelta
