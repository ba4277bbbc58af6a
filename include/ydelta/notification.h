// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file notification.h
/// @brief gNMI-style change notifications produced by the diff engine.

#pragma once

#include "api.h"
#include "path.h"
#include "typed_value.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ydelta {

struct Update {
    Path path;
    TypedValue val;

    bool operator==(const Update& other) const = default;
};

/// @brief One change message.
///
/// Update paths are relative to the prefix when one is set. An atomic
/// notification must be applied by a consumer as a single unit that
/// replaces the whole subtree under its prefix.
struct YDELTA_API Notification {
    std::int64_t timestamp = 0;
    std::optional<Path> prefix;
    bool atomic = false;
    std::vector<Update> updates;
    std::vector<Path> deletes;

    [[nodiscard]] bool empty() const noexcept { return updates.empty() && deletes.empty(); }
};

/// @brief Compare two notifications by content.
///
/// Prefix, atomic flag and the delete set must match. Updates are compared
/// as a set keyed by path for non-atomic notifications and in order for
/// atomic ones, whose update order carries the list order. Timestamps are
/// ignored.
[[nodiscard]] YDELTA_API bool notification_equal(const Notification& a, const Notification& b);

/// @brief Compare two notification lists ignoring the order of the lists.
[[nodiscard]] YDELTA_API bool notification_set_equal(const std::vector<Notification>& a,
                                                     const std::vector<Notification>& b);

/// Multi-line readable dump, one update or delete per line.
[[nodiscard]] YDELTA_API std::string notification_to_string(const Notification& n);

YDELTA_API void print_notification(const Notification& n);

} // namespace ydelta
