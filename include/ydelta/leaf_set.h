// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file leaf_set.h
/// @brief Extraction of the populated leaves of a data tree with their wire paths.
///
/// find_set_leaves() walks a snapshot and returns every set leaf (scalar,
/// leaf-list, enumeration) together with its resolved PathSpec. Containers
/// and lists are not reported themselves, only their leaves. When
/// ordered_list_as_leaf is true, a non-empty ordered-by user list is
/// reported as a single leaf and its entries are not visited.
///
/// Usage:
/// @code
///   auto leaves = find_set_leaves(tree, false);
///   for (const auto& [path, info] : to_string_path_map(leaves)) {
///       std::cout << path << " = " << value_to_string(*info.value.leaf()) << "\n";
///   }
/// @endcode

#pragma once

#include "api.h"
#include "diff_options.h"
#include "path_resolver.h"
#include "value.h"

#include <map>
#include <string>
#include <vector>

namespace ydelta {

struct LeafEntry {
    PathSpec paths;
    Node value; // LeafValue, or OrderedList when reported as a leaf
    const FieldDescriptor* field = nullptr;
};

using LeafSet = std::vector<LeafEntry>;

/// A leaf under one of its canonical paths
struct PathInfo {
    Path path;
    Node value;
    const FieldDescriptor* field = nullptr;
};

using StringPathMap = std::map<std::string, PathInfo>;

/// Shortest alias (fewest segments); the first one wins ties.
[[nodiscard]] YDELTA_API SchemaPath least_specific_path(const std::vector<SchemaPath>& paths);

/// Unset leaves are never reported: absent values, empty leaf-lists, a false
/// YANG empty leaf and enumerations whose value is 0 (union wrapping removed).
[[nodiscard]] YDELTA_API bool is_unset_leaf(const LeafValue& val, const FieldDescriptor& field);

/// @throws DiffError on missing aliases or unrenderable list keys; no partial result is returned
[[nodiscard]] YDELTA_API LeafSet find_set_leaves(const Record& root,
                                                 bool ordered_list_as_leaf,
                                                 const DiffOptions& opts = {});

/// One entry per alias path of every leaf, keyed by canonical path string.
[[nodiscard]] YDELTA_API StringPathMap to_string_path_map(const LeafSet& leaves);

} // namespace ydelta
