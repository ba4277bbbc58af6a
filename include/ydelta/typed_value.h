// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file typed_value.h
/// @brief gNMI TypedValue wire union and conversions to and from leaf values.
///
/// Encoding (encode_typed_value):
///   string                -> string_val
///   int8 .. int64         -> int_val
///   uint8 .. uint64       -> uint_val
///   float                 -> float_val
///   double                -> double_val
///   bool / empty          -> bool_val
///   binary                -> bytes_val
///   enumeration           -> string_val holding the enum name
///   union                 -> encoding of the member value
///   leaf-list             -> leaflist_val (ScalarArray)
///
/// Decoding (decode_typed_value) is driven by the field's declared LeafType,
/// with range checks for the narrower integer types.

#pragma once

#include "api.h"
#include "schema.h"
#include "value.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ydelta {

struct TypedValue;

/// Leaf-list payload of a TypedValue
struct ScalarArray {
    std::vector<TypedValue> element;

    bool operator==(const ScalarArray& other) const;
};

struct YDELTA_API TypedValue {
    using bytes = std::vector<std::uint8_t>;

    std::variant<std::monostate,
                 std::string,  // string_val
                 std::int64_t, // int_val
                 std::uint64_t,// uint_val
                 bool,         // bool_val
                 bytes,        // bytes_val
                 float,        // float_val
                 double,       // double_val
                 ScalarArray>  // leaflist_val
        value;

    TypedValue() noexcept : value(std::monostate{}) {}
    TypedValue(std::string v) : value(std::move(v)) {}
    TypedValue(const char* v) : value(std::in_place_type<std::string>, v) {}
    TypedValue(std::int64_t v) noexcept : value(v) {}
    TypedValue(std::uint64_t v) noexcept : value(v) {}
    TypedValue(bool v) noexcept : value(v) {}
    TypedValue(bytes v) noexcept : value(std::move(v)) {}
    TypedValue(float v) noexcept : value(v) {}
    TypedValue(double v) noexcept : value(v) {}
    TypedValue(ScalarArray v) noexcept : value(std::move(v)) {}

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&value); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(value); }

    bool operator==(const TypedValue& other) const { return value == other.value; }
};

inline bool ScalarArray::operator==(const ScalarArray& other) const
{
    return element == other.element;
}

/// Readable form, e.g. `string_val:"eth0"` or `leaflist_val:[uint_val:1 uint_val:2]`.
[[nodiscard]] YDELTA_API std::string typed_value_to_string(const TypedValue& val);

/// @throws DiffError(ValueEncodingFailure) for unset values, unnamed enums and nested leaf-lists
[[nodiscard]] YDELTA_API TypedValue encode_typed_value(const LeafValue& val);

/// @brief Convert a wire value back into a leaf value of the field's type.
/// @throws DiffError(ValueDecodingFailure) on type or range mismatch
[[nodiscard]] YDELTA_API LeafValue decode_typed_value(const TypedValue& val, const FieldDescriptor& field);

/// @brief Parse a key predicate value (the inverse of key_value_as_string).
/// @throws DiffError(ValueDecodingFailure) if text is not a valid value of the field's type
[[nodiscard]] YDELTA_API LeafValue key_value_from_string(std::string_view text, const FieldDescriptor& field);

} // namespace ydelta
