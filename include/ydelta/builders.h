// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of data tree snapshots.
///
/// This file provides transient-based builders:
/// - RecordBuilder: Build a Record (container or list entry)
/// - OrderedListBuilder: Build an ordered-by user list
/// - UnorderedListBuilder: Build a keyed list, entries indexed by their key predicate
///
/// Usage:
/// @code
///   #include <ydelta/builders.h>
///
///   Record iface = RecordBuilder(interface_schema)
///       .set("name", "eth0")
///       .set("mtu", uint16_t{1500})
///       .finish();
///
///   Record device = RecordBuilder(device_schema)
///       .set("interface", UnorderedListBuilder().insert(iface).finish())
///       .finish();
/// @endcode

#pragma once

#include "errors.h"
#include "keys.h"
#include "log.h"
#include "value.h"

#include <set>
#include <string>
#include <type_traits>
#include <utility>

namespace ydelta {

// ============================================================
// Builder classes for O(n) construction using immer's transient API
// ============================================================

/// Builder for a Record - O(n) complexity
class RecordBuilder {
public:
    using transient_type = FieldMap::transient_type;

    explicit RecordBuilder(const RecordSchema& schema)
        : schema_(&schema), transient_(FieldMap{}.transient()) {}

    ///   auto updated = RecordBuilder(device)
    ///       .set("hostname", "spine-1")
    ///       .finish();
    explicit RecordBuilder(const Record& existing)
        : schema_(existing.schema), transient_(existing.fields.transient()) {}

    // Move operations (allowed)
    RecordBuilder(RecordBuilder&&) noexcept = default;
    RecordBuilder& operator=(RecordBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    RecordBuilder(const RecordBuilder&) = delete;
    RecordBuilder& operator=(const RecordBuilder&) = delete;

    /// Set a field. Anything a Node is built from (records, lists, leaf
    /// values) is stored as is; other values are wrapped in a LeafValue.
    /// A null value unsets the field. Unknown fields are logged and ignored.
    template <typename T>
    RecordBuilder& set(const std::string& field, T&& val) {
        if constexpr (std::is_constructible_v<Node, T&&>) {
            return set_node(field, Node{std::forward<T>(val)});
        } else {
            return set_node(field, Node{LeafValue{std::forward<T>(val)}});
        }
    }

    RecordBuilder& erase(const std::string& field) {
        transient_.erase(field);
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& field) const {
        return transient_.count(field) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish building and return the immutable Record.
    /// The builder must not be used after calling finish().
    [[nodiscard]] Record finish() {
        return Record{schema_, transient_.persistent()};
    }

private:
    RecordBuilder& set_node(const std::string& field, Node node) {
        if (!schema_ || !schema_->field(field)) [[unlikely]] {
            detail::log_field_error("RecordBuilder::set", field,
                                    schema_ ? "is not declared by " + schema_->name
                                            : std::string("cannot set on a record without schema"));
            return *this;
        }
        if (node.is_null()) {
            transient_.erase(field);
        } else {
            transient_.set(field, std::move(node));
        }
        return *this;
    }

    const RecordSchema* schema_;
    transient_type transient_;
};

/// Builder for an ordered-by user list - O(n) complexity
class OrderedListBuilder {
public:
    using transient_type = OrderedList::entry_vector::transient_type;

    OrderedListBuilder() : transient_(OrderedList::entry_vector{}.transient()) {}
    explicit OrderedListBuilder(const OrderedList& existing) : transient_(existing.entries.transient()) {
        for (const auto& entry : existing.entries) {
            keys_.insert(list_key_string(entry.get()));
        }
    }

    OrderedListBuilder(OrderedListBuilder&&) noexcept = default;
    OrderedListBuilder& operator=(OrderedListBuilder&&) noexcept = default;
    OrderedListBuilder(const OrderedListBuilder&) = delete;
    OrderedListBuilder& operator=(const OrderedListBuilder&) = delete;

    /// @throws DiffError(InvalidKeyMap) if an entry with the same keys was already appended
    OrderedListBuilder& append(Record entry) {
        std::string key = list_key_string(entry);
        if (!keys_.insert(key).second) {
            throw DiffError(DiffErrorCode::InvalidKeyMap, "duplicate ordered list entry " + key);
        }
        transient_.push_back(RecordBox{std::move(entry)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] OrderedList finish() {
        return OrderedList{transient_.persistent()};
    }

private:
    transient_type transient_;
    std::set<std::string> keys_;
};

/// Builder for a keyed list without user order - O(n) complexity
class UnorderedListBuilder {
public:
    using transient_type = UnorderedList::transient_type;

    UnorderedListBuilder() : transient_(UnorderedList{}.transient()) {}
    explicit UnorderedListBuilder(const UnorderedList& existing) : transient_(existing.transient()) {}

    UnorderedListBuilder(UnorderedListBuilder&&) noexcept = default;
    UnorderedListBuilder& operator=(UnorderedListBuilder&&) noexcept = default;
    UnorderedListBuilder(const UnorderedListBuilder&) = delete;
    UnorderedListBuilder& operator=(const UnorderedListBuilder&) = delete;

    /// Insert or replace the entry with the same keys.
    /// @throws DiffError(InvalidKeyMap, KeyStringFailure) if the entry keys cannot be rendered
    UnorderedListBuilder& insert(Record entry) {
        std::string key = list_key_string(entry);
        transient_.set(std::move(key), RecordBox{std::move(entry)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] UnorderedList finish() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

} // namespace ydelta
