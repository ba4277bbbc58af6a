// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file walk.h
/// @brief Pre-order traversal over the declared fields of a data tree.
///
/// for_each_data_field visits every declared field of the root record in
/// declaration order, descending depth-first into containers and into each
/// entry of unordered and ordered lists. List entries are visited as nodes of
/// their own (NodeInfo::entry set, field pointing at the list field) before
/// their fields.
///
/// Every visited node gets a traversal-local index, and each NodeInfo names
/// its parent's index. Callers keep per-node state in side tables keyed by
/// that index, so the (shared, immutable) tree is never annotated.

#pragma once

#include "api.h"
#include "value.h"

#include <cstddef>
#include <functional>
#include <optional>

namespace ydelta {

enum class IterationAction {
    Continue,
    DoNotIterateDescendants,
};

struct NodeInfo {
    std::size_t index = 0;
    std::optional<std::size_t> parent; // unset for fields of the root record
    const FieldDescriptor* field = nullptr;
    const Node* value = nullptr;   // field nodes (absent fields point at an empty Node)
    const Record* entry = nullptr; // list entry nodes

    [[nodiscard]] bool is_list_entry() const noexcept { return entry != nullptr; }
};

using FieldVisitor = std::function<IterationAction(const NodeInfo&)>;

/// Exceptions thrown by the visitor abort the traversal and propagate.
YDELTA_API void for_each_data_field(const Record& root, const FieldVisitor& visitor);

} // namespace ydelta
