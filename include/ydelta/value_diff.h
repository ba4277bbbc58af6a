// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Diff of two data tree snapshots into change notifications.
///
/// Two entry points:
/// - diff(): one non-atomic Notification. Ordered-by user lists are
///   flattened into ordinary per-leaf updates (nesting is tolerated).
/// - diff_with_atomic(): one atomic Notification per changed ordered-by
///   user list, followed by at most one non-atomic Notification holding
///   every other update and all deletes. Nested ordered lists are rejected.
///
/// Replaying the diff_with_atomic() output in order onto the original tree
/// reproduces the modified tree (see apply.h).
///
/// Example:
/// @code
///   Notification n = diff(before, after);
///   for (const auto& u : n.updates) {
///       std::cout << path_to_string(u.path) << " = " << typed_value_to_string(u.val) << "\n";
///   }
///
///   // Non-throwing variant
///   auto result = diff_with_atomic_safe(before, after);
///   if (!result) {
///       std::cerr << result.error_message << "\n";
///   }
/// @endcode

#pragma once

#include "api.h"
#include "diff_options.h"
#include "errors.h"
#include "notification.h"
#include "value.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace ydelta {

/// @brief Diff two snapshots of the same record schema.
/// @return Empty notification when nothing changed
/// @throws DiffError (TypeMismatch, MissingSchemaPath, InvalidKeyMap, KeyStringFailure,
///         ValueEncodingFailure, Internal)
[[nodiscard]] YDELTA_API Notification diff(const Record& original,
                                           const Record& modified,
                                           const DiffOptions& opts = {});

/// @brief Diff two snapshots, republishing changed ordered-by user lists atomically.
/// @return Atomic notifications first, then the non-atomic one (if it has content)
/// @throws DiffError as diff(), plus NestedOrderedList
[[nodiscard]] YDELTA_API std::vector<Notification> diff_with_atomic(const Record& original,
                                                                    const Record& modified,
                                                                    const DiffOptions& opts = {});

// ============================================================
// Safe (non-throwing) API
// ============================================================

struct DiffResult {
    std::vector<Notification> notifications;
    bool success = false;
    DiffErrorCode error_code = DiffErrorCode::Success;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }

    const std::vector<Notification>& get() const {
        if (!success) {
            throw DiffError(error_code, "Diff failed: " + error_message);
        }
        return notifications;
    }
};

/// diff() without exceptions. On success notifications holds exactly one element.
[[nodiscard]] YDELTA_API DiffResult diff_safe(const Record& original,
                                              const Record& modified,
                                              const DiffOptions& opts = {});

[[nodiscard]] YDELTA_API DiffResult diff_with_atomic_safe(const Record& original,
                                                          const Record& modified,
                                                          const DiffOptions& opts = {});

} // namespace ydelta
