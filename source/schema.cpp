// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// schema.cpp - Descriptor table helpers

#include <ydelta/schema.h>

#include <algorithm>

namespace ydelta {

std::string_view leaf_type_name(LeafType type) noexcept
{
    switch (type) {
        case LeafType::String: return "string";
        case LeafType::Int8:   return "int8";
        case LeafType::Int16:  return "int16";
        case LeafType::Int32:  return "int32";
        case LeafType::Int64:  return "int64";
        case LeafType::Uint8:  return "uint8";
        case LeafType::Uint16: return "uint16";
        case LeafType::Uint32: return "uint32";
        case LeafType::Uint64: return "uint64";
        case LeafType::Float:  return "float";
        case LeafType::Double: return "double";
        case LeafType::Bool:   return "boolean";
        case LeafType::Empty:  return "empty";
        case LeafType::Binary: return "binary";
        case LeafType::Enum:   return "enumeration";
        case LeafType::Union:  return "union";
    }
    return "unknown";
}

// ============================================================
// EnumDescriptor
// ============================================================

std::optional<std::string> EnumDescriptor::name_of(std::int64_t value) const
{
    if (auto it = names.find(value); it != names.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<std::int64_t> EnumDescriptor::value_of(std::string_view enum_name) const
{
    auto it = std::ranges::find_if(names, [&](const auto& kv) { return kv.second == enum_name; });
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->first;
}

// ============================================================
// FieldDescriptor factories
// ============================================================

FieldDescriptor FieldDescriptor::leaf(std::string name, std::string_view paths, LeafType type)
{
    FieldDescriptor fd;
    fd.name = std::move(name);
    fd.kind = NodeKind::Leaf;
    fd.paths = parse_schema_paths(paths);
    fd.leaf_type = type;
    return fd;
}

FieldDescriptor FieldDescriptor::leaf_list_of(std::string name, std::string_view paths, LeafType type)
{
    auto fd = leaf(std::move(name), paths, type);
    fd.leaf_list = true;
    return fd;
}

FieldDescriptor FieldDescriptor::enumeration(std::string name, std::string_view paths,
                                             const EnumDescriptor& type)
{
    auto fd = leaf(std::move(name), paths, LeafType::Enum);
    fd.enum_type = &type;
    return fd;
}

FieldDescriptor FieldDescriptor::container(std::string name, std::string_view paths,
                                           const RecordSchema& record)
{
    FieldDescriptor fd;
    fd.name = std::move(name);
    fd.kind = NodeKind::Container;
    fd.paths = parse_schema_paths(paths);
    fd.record = &record;
    return fd;
}

FieldDescriptor FieldDescriptor::list(std::string name, std::string_view paths,
                                      const RecordSchema& entry)
{
    auto fd = container(std::move(name), paths, entry);
    fd.kind = NodeKind::UnorderedList;
    return fd;
}

FieldDescriptor FieldDescriptor::ordered_list(std::string name, std::string_view paths,
                                              const RecordSchema& entry)
{
    auto fd = container(std::move(name), paths, entry);
    fd.kind = NodeKind::OrderedList;
    return fd;
}

FieldDescriptor FieldDescriptor::annotation_field(std::string name)
{
    FieldDescriptor fd;
    fd.name = std::move(name);
    fd.annotation = true;
    return fd;
}

FieldDescriptor FieldDescriptor::with_shadow_paths(std::string_view shadow) &&
{
    shadow_paths = parse_schema_paths(shadow);
    return std::move(*this);
}

// ============================================================
// RecordSchema
// ============================================================

const FieldDescriptor* RecordSchema::field(std::string_view field_name) const noexcept
{
    for (const auto& fd : fields) {
        if (fd.name == field_name) {
            return &fd;
        }
    }
    return nullptr;
}

// ============================================================
// Alias parsing
// ============================================================

std::vector<SchemaPath> parse_schema_paths(std::string_view paths)
{
    std::vector<SchemaPath> result;
    while (!paths.empty()) {
        auto bar = paths.find('|');
        std::string_view alias = paths.substr(0, bar);

        if (!alias.empty() && alias.front() == '/') {
            alias.remove_prefix(1);
        }

        SchemaPath segments;
        while (!alias.empty()) {
            auto slash = alias.find('/');
            auto segment = alias.substr(0, slash);
            if (!segment.empty()) {
                segments.emplace_back(segment);
            }
            if (slash == std::string_view::npos) {
                break;
            }
            alias.remove_prefix(slash + 1);
        }
        if (!segments.empty()) {
            result.push_back(std::move(segments));
        }

        if (bar == std::string_view::npos) {
            break;
        }
        paths.remove_prefix(bar + 1);
    }
    return result;
}

std::string schema_path_to_string(const SchemaPath& path)
{
    std::string result;
    for (const auto& segment : path) {
        if (!result.empty()) {
            result += '/';
        }
        result += segment;
    }
    return result;
}

} // namespace ydelta
