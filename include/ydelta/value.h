// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable data tree snapshots of YANG-modelled records.
///
/// A snapshot is a Record: a schema pointer plus an immer::map from field
/// name to Node. A Node is one of:
/// - absent (std::monostate)
/// - LeafValue: scalar, leaf-list, enumeration or union member
/// - RecordBox: a container
/// - UnorderedList: keyed entries, order irrelevant
/// - OrderedList: keyed entries in user order (ordered-by user)
///
/// All containers are immer persistent structures, so copying a snapshot is
/// O(1) and "modifying" one returns a new snapshot sharing structure with
/// the old one. Snapshots are never mutated by diff operations.

#pragma once

#include "ydelta_config.h"
#include "api.h"
#include "schema.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ydelta {

/// Atomic refcounts unless YDELTA_THREAD_SAFE_TREES is 0 (see ydelta_config.h).
using tree_memory_policy = immer::default_memory_policy;

/// YANG binary value
using Binary = std::vector<std::uint8_t>;

/// Integer value of a YANG enumeration together with its name table.
struct EnumValue {
    const EnumDescriptor* type = nullptr;
    std::int64_t value = 0;

    [[nodiscard]] std::optional<std::string> name() const {
        if (!type) return std::nullopt;
        return type->name_of(value);
    }

    bool operator==(const EnumValue& other) const = default;
};

struct LeafValue;

using LeafBox  = immer::box<LeafValue, tree_memory_policy>;
using LeafList = immer::vector<LeafBox, tree_memory_policy>;

/// One level of union wrapping around the member value actually held.
struct UnionValue {
    LeafBox value;

    bool operator==(const UnionValue& other) const;
};

// ============================================================
// LeafValue
// ============================================================

struct YDELTA_API LeafValue
{
    std::variant<std::monostate,
                 int8_t,
                 int16_t,
                 int32_t,
                 int64_t,
                 uint8_t,
                 uint16_t,
                 uint32_t,
                 uint64_t,
                 float,
                 double,
                 bool,
                 std::string,
                 Binary,
                 EnumValue,
                 UnionValue,
                 LeafList>
        data;

    LeafValue() noexcept : data(std::monostate{}) {}
    LeafValue(int8_t v) noexcept : data(v) {}
    LeafValue(int16_t v) noexcept : data(v) {}
    LeafValue(int32_t v) noexcept : data(v) {}
    LeafValue(int64_t v) noexcept : data(v) {}
    LeafValue(uint8_t v) noexcept : data(v) {}
    LeafValue(uint16_t v) noexcept : data(v) {}
    LeafValue(uint32_t v) noexcept : data(v) {}
    LeafValue(uint64_t v) noexcept : data(v) {}
    LeafValue(float v) noexcept : data(v) {}
    LeafValue(double v) noexcept : data(v) {}
    LeafValue(bool v) noexcept : data(v) {}
    LeafValue(const std::string& v) : data(v) {}
    LeafValue(std::string&& v) noexcept : data(std::move(v)) {}
    LeafValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    LeafValue(Binary v) noexcept : data(std::move(v)) {}
    LeafValue(EnumValue v) noexcept : data(v) {}
    LeafValue(UnionValue v) noexcept : data(std::move(v)) {}
    LeafValue(LeafList v) noexcept : data(std::move(v)) {}

    /// Wrap a member value of a YANG union.
    static LeafValue union_of(LeafValue member) {
        return LeafValue{UnionValue{LeafBox{std::move(member)}}};
    }

    static LeafValue leaf_list(std::initializer_list<LeafValue> init) {
        auto t = LeafList{}.transient();
        for (const auto& v : init) {
            t.push_back(LeafBox{v});
        }
        return LeafValue{t.persistent()};
    }

    static LeafValue enumeration(const EnumDescriptor& type, std::int64_t value) {
        return LeafValue{EnumValue{&type, value}};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }

    /// The member value for a union, the value itself otherwise.
    [[nodiscard]] const LeafValue& unwrapped() const {
        if (auto* u = get_if<UnionValue>()) return u->value.get();
        return *this;
    }

    bool operator==(const LeafValue& other) const { return data == other.data; }
};

inline bool UnionValue::operator==(const UnionValue& other) const
{
    return value == other.value;
}

/// Human readable rendering, used in diagnostics and error messages.
[[nodiscard]] YDELTA_API std::string value_to_string(const LeafValue& val);

// ============================================================
// Tree nodes
// ============================================================

struct Record;
struct Node;

using RecordBox = immer::box<Record, tree_memory_policy>;

/// Entries of an unordered list, keyed by their key predicate ("[name=eth0]").
using UnorderedList = immer::map<std::string,
                                 RecordBox,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 tree_memory_policy>;

/// Entries of an ordered-by user list, in user order.
struct YDELTA_API OrderedList {
    using entry_vector = immer::vector<RecordBox, tree_memory_policy>;

    entry_vector entries;

    [[nodiscard]] std::size_t size() const noexcept { return entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }

    bool operator==(const OrderedList& other) const;
};

struct YDELTA_API Node
{
    std::variant<std::monostate, LeafValue, RecordBox, UnorderedList, OrderedList> data;

    Node() noexcept : data(std::monostate{}) {}
    Node(LeafValue v) : data(std::move(v)) {}
    Node(Record v);
    Node(RecordBox v) : data(std::move(v)) {}
    Node(UnorderedList v) : data(std::move(v)) {}
    Node(OrderedList v) : data(std::move(v)) {}

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }

    [[nodiscard]] const LeafValue* leaf() const { return get_if<LeafValue>(); }
    [[nodiscard]] const Record* record() const;

    bool operator==(const Node& other) const;
};

/// Field name to node map of a record
using FieldMap = immer::map<std::string,
                            Node,
                            std::hash<std::string>,
                            std::equal_to<std::string>,
                            tree_memory_policy>;

// ============================================================
// Record
// ============================================================

struct YDELTA_API Record
{
    const RecordSchema* schema = nullptr;
    FieldMap fields;

    Record() = default;
    explicit Record(const RecordSchema& s) : schema(&s) {}
    Record(const RecordSchema* s, FieldMap f) : schema(s), fields(std::move(f)) {}

    [[nodiscard]] const Node* find(const std::string& name) const { return fields.find(name); }

    /// Node stored under a field, or an absent node.
    [[nodiscard]] Node get(const std::string& name) const;

    [[nodiscard]] bool has(const std::string& name) const { return fields.count(name) > 0; }

    /// New record with a field replaced. Unknown field names are logged and ignored.
    [[nodiscard]] Record set(const std::string& name, Node value) const;

    [[nodiscard]] Record erase(const std::string& name) const;

    [[nodiscard]] std::size_t size() const noexcept { return fields.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields.empty(); }

    /// @brief Key fields of a list entry, by key field name.
    /// @throws DiffError(InvalidKeyMap) when the record is not a list entry or a key is unset
    [[nodiscard]] std::map<std::string, LeafValue> key_map() const;

    bool operator==(const Record& other) const;
};

inline Node::Node(Record v) : data(RecordBox{std::move(v)}) {}

inline const Record* Node::record() const
{
    if (auto* box = get_if<RecordBox>()) return &box->get();
    return nullptr;
}

} // namespace ydelta
