// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file schema.h
/// @brief Descriptor tables describing YANG-modelled record types.
///
/// Every record type of a data tree is described by a RecordSchema: its
/// fields in declaration order, and for list entries the names of its key
/// fields. Each FieldDescriptor carries the schema path aliases the field is
/// addressable by (more than one when path compression applies, e.g. a leaf
/// reachable as both "name" and "config/name"), an optional set of shadow
/// aliases, the node kind and, for leaves, the leaf type.
///
/// Schemas are static tables: they must outlive every tree built from them.
///
/// @code
///   static const RecordSchema interface_schema{
///       "Interface",
///       {
///           FieldDescriptor::leaf("name", "name|config/name", LeafType::String),
///           FieldDescriptor::leaf("mtu", "config/mtu", LeafType::Uint16),
///       },
///       {"name"}};
/// @endcode

#pragma once

#include "api.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ydelta {

/// One relative schema path alias, split into segments.
using SchemaPath = std::vector<std::string>;

/// Structural kind of a field.
enum class NodeKind : std::uint8_t {
    Leaf,          // scalar, leaf-list or enumerated value
    Container,     // nested record
    UnorderedList, // keyed records, order irrelevant
    OrderedList,   // keyed records, ordered-by user
};

/// Declared YANG type of a leaf or leaf-list element.
enum class LeafType : std::uint8_t {
    String,
    Int8,
    Int16,
    Int32,
    Int64,
    Uint8,
    Uint16,
    Uint32,
    Uint64,
    Float,
    Double,
    Bool,
    Empty,
    Binary,
    Enum,
    Union,
};

[[nodiscard]] YDELTA_API std::string_view leaf_type_name(LeafType type) noexcept;

/// Name table of a YANG enumeration. Value 0 is reserved for "unset".
struct YDELTA_API EnumDescriptor {
    std::string name;
    std::map<std::int64_t, std::string> names;

    [[nodiscard]] std::optional<std::string> name_of(std::int64_t value) const;
    [[nodiscard]] std::optional<std::int64_t> value_of(std::string_view name) const;
};

struct RecordSchema;

struct YDELTA_API FieldDescriptor {
    std::string name;
    NodeKind kind = NodeKind::Leaf;
    std::vector<SchemaPath> paths;
    std::vector<SchemaPath> shadow_paths;
    LeafType leaf_type = LeafType::String;
    bool leaf_list = false;
    const EnumDescriptor* enum_type = nullptr;
    const RecordSchema* record = nullptr; // container or list entry type
    bool annotation = false;              // reserved metadata, never diffed

    [[nodiscard]] static FieldDescriptor leaf(std::string name, std::string_view paths, LeafType type);
    [[nodiscard]] static FieldDescriptor leaf_list_of(std::string name, std::string_view paths, LeafType type);
    [[nodiscard]] static FieldDescriptor enumeration(std::string name, std::string_view paths,
                                                     const EnumDescriptor& type);
    [[nodiscard]] static FieldDescriptor container(std::string name, std::string_view paths,
                                                   const RecordSchema& record);
    [[nodiscard]] static FieldDescriptor list(std::string name, std::string_view paths,
                                              const RecordSchema& entry);
    [[nodiscard]] static FieldDescriptor ordered_list(std::string name, std::string_view paths,
                                                      const RecordSchema& entry);
    [[nodiscard]] static FieldDescriptor annotation_field(std::string name);

    /// Attach shadow aliases (the schema paths of the opposite config/state view).
    [[nodiscard]] FieldDescriptor with_shadow_paths(std::string_view shadow) &&;

    [[nodiscard]] bool is_leaf() const noexcept { return kind == NodeKind::Leaf; }
    [[nodiscard]] bool is_list() const noexcept {
        return kind == NodeKind::UnorderedList || kind == NodeKind::OrderedList;
    }
};

struct YDELTA_API RecordSchema {
    std::string name;
    std::vector<FieldDescriptor> fields;
    std::vector<std::string> keys; // key field names; non-empty for list entries

    [[nodiscard]] const FieldDescriptor* field(std::string_view field_name) const noexcept;
    [[nodiscard]] bool is_list_entry() const noexcept { return !keys.empty(); }
};

/// @brief Parse a tag-style alias list, e.g. "name|config/name".
///
/// Aliases are separated by '|', segments by '/'. A leading '/' is ignored.
/// An empty string yields no aliases.
[[nodiscard]] YDELTA_API std::vector<SchemaPath> parse_schema_paths(std::string_view paths);

[[nodiscard]] YDELTA_API std::string schema_path_to_string(const SchemaPath& path);

} // namespace ydelta
