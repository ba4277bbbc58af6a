// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_options.h
/// @brief Per-call diff policies. Every option is off by default.

#pragma once

namespace ydelta {

struct DiffOptions {
    /// Drop updates for paths present only in the modified tree.
    bool ignore_additions = false;

    /// Report each leaf under its shortest alias only.
    bool map_to_single_path = false;

    /// Use a field's shadow aliases instead of its primary ones when it declares any.
    bool prefer_shadow_path = false;
};

} // namespace ydelta
