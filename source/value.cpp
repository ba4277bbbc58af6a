// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Record, Node and LeafValue implementation

#include <ydelta/value.h>
#include <ydelta/errors.h>
#include <ydelta/log.h>

#include <sstream>
#include <type_traits>

namespace ydelta {

namespace {

void append_value(std::ostringstream& oss, const LeafValue& val)
{
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, uint8_t>) {
            oss << static_cast<int>(v);
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, Binary>) {
            oss << '[';
            for (std::size_t i = 0; i < v.size(); ++i) {
                oss << (i ? " " : "") << static_cast<int>(v[i]);
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, EnumValue>) {
            if (auto name = v.name()) {
                oss << *name;
            } else {
                oss << v.value;
            }
        } else if constexpr (std::is_same_v<T, UnionValue>) {
            append_value(oss, v.value.get());
        } else if constexpr (std::is_same_v<T, LeafList>) {
            oss << '[';
            bool first = true;
            for (const auto& item : v) {
                if (!first) oss << ' ';
                append_value(oss, item.get());
                first = false;
            }
            oss << ']';
        } else {
            oss << v;
        }
    }, val.data);
}

} // anonymous namespace

std::string value_to_string(const LeafValue& val)
{
    std::ostringstream oss;
    append_value(oss, val);
    return oss.str();
}

// ============================================================
// Node / OrderedList
// ============================================================

bool OrderedList::operator==(const OrderedList& other) const
{
    return entries == other.entries;
}

bool Node::operator==(const Node& other) const
{
    return data == other.data;
}

// ============================================================
// Record
// ============================================================

Node Record::get(const std::string& name) const
{
    if (auto* found = fields.find(name)) {
        return *found;
    }
    return Node{};
}

Record Record::set(const std::string& name, Node value) const
{
    if (!schema) [[unlikely]] {
        detail::log_field_error("Record::set", name, "cannot set on a record without schema");
        return *this;
    }
    if (!schema->field(name)) [[unlikely]] {
        detail::log_field_error("Record::set", name, "is not declared by " + schema->name);
        return *this;
    }
    if (value.is_null()) {
        return erase(name);
    }
    return Record{schema, fields.set(name, std::move(value))};
}

Record Record::erase(const std::string& name) const
{
    return Record{schema, fields.erase(name)};
}

std::map<std::string, LeafValue> Record::key_map() const
{
    if (!schema || !schema->is_list_entry()) {
        throw DiffError(DiffErrorCode::InvalidKeyMap,
                        "record " + (schema ? schema->name : std::string("<unknown>")) +
                            " is not a list entry");
    }

    std::map<std::string, LeafValue> keys;
    for (const auto& key : schema->keys) {
        const Node* node = fields.find(key);
        const LeafValue* leaf = node ? node->leaf() : nullptr;
        if (!leaf || leaf->is_null()) {
            throw DiffError(DiffErrorCode::InvalidKeyMap,
                            "list entry " + schema->name + " has no value for key field " + key);
        }
        keys.emplace(key, *leaf);
    }
    return keys;
}

bool Record::operator==(const Record& other) const
{
    return schema == other.schema && fields == other.fields;
}

} // namespace ydelta
