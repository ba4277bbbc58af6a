// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file apply.h
/// @brief Replay of change notifications onto a data tree snapshot.
///
/// This is the consumer side of diff_with_atomic():
///
/// @code
///   auto notifications = diff_with_atomic(before, after);
///   Record replayed = apply_notifications(before, notifications);
///   // replayed == after
/// @endcode
///
/// Semantics:
/// - An atomic notification first removes everything under its prefix,
///   then applies its updates; ordered list entries are appended in the
///   order their first update appears.
/// - A non-atomic notification applies its deletes, then its updates.
/// - Paths are matched against the primary and shadow aliases of fields.
///   A delete whose path stops inside a compressed alias (e.g. "/a" for
///   alias "a/b") removes every field under it.
/// - Missing containers and list entries are created on update; a new
///   entry gets its key leaves from the path's key predicate.
/// - Deleting something that is absent is a no-op. Containers and list
///   entries left empty by deletes are removed.

#pragma once

#include "api.h"
#include "notification.h"
#include "value.h"

#include <vector>

namespace ydelta {

/// @throws DiffError(UnknownPath) if a path addresses no field
/// @throws DiffError(ValueDecodingFailure) if a value or key does not fit its field
[[nodiscard]] YDELTA_API Record apply_notification(const Record& root, const Notification& n);

/// Applies the notifications in order.
[[nodiscard]] YDELTA_API Record apply_notifications(const Record& root,
                                                    const std::vector<Notification>& notifications);

/// @brief Set one leaf from a wire value, creating containers and entries on the way.
[[nodiscard]] YDELTA_API Record apply_update(const Record& root, const Path& path, const TypedValue& val);

/// @brief Remove the node addressed by path (no-op if absent).
[[nodiscard]] YDELTA_API Record apply_delete(const Record& root, const Path& path);

} // namespace ydelta
