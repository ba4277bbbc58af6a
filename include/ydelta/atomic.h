// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file atomic.h
/// @brief Atomic grouping of ordered-by user lists.
///
/// The order of an ordered-by user list is part of its value, so a changed
/// list is republished as a whole: one atomic Notification whose prefix is
/// the list's parent path and whose updates are every leaf of every entry,
/// in list order, relative to that prefix.
///
/// An ordered list nested inside an entry cannot be represented this way
/// and is rejected with NestedOrderedList.

#pragma once

#include "api.h"
#include "notification.h"
#include "path.h"
#include "value.h"

#include <optional>
#include <vector>

namespace ydelta {

struct PathValue {
    Path path;
    LeafValue value;
};

struct AtomicLeaves {
    Path prefix;                  // list path without its last element
    std::vector<PathValue> leaves; // absolute paths, entry order then declaration order
};

/// @throws DiffError(NestedOrderedList) if an entry holds an ordered list
/// @throws DiffError(InvalidPath) if list_path is empty
[[nodiscard]] YDELTA_API AtomicLeaves ordered_list_leaves(const OrderedList& list,
                                                          const Path& list_path,
                                                          bool prefer_shadow_path);

/// @brief Atomic notification replacing the list at list_path, or nullopt when it has no leaves.
/// @throws DiffError as ordered_list_leaves(), or ValueEncodingFailure
[[nodiscard]] YDELTA_API std::optional<Notification> ordered_list_notification(const OrderedList& list,
                                                                               const Path& list_path,
                                                                               bool prefer_shadow_path);

} // namespace ydelta
