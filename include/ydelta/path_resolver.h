// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_resolver.h
/// @brief Resolution of a node's absolute wire paths from its schema aliases.
///
/// A node reachable through several aliases (path compression) has several
/// absolute paths. Together they form its PathSpec:
/// - fields of the root record: one path per alias
/// - other fields: every parent path joined with every alias
/// - list entries: the list's paths, with the entry's key predicate on the
///   last element

#pragma once

#include "api.h"
#include "path.h"
#include "schema.h"
#include "walk.h"

#include <optional>
#include <string>
#include <vector>

namespace ydelta {

/// Resolved absolute paths of one node.
struct YDELTA_API PathSpec {
    std::vector<Path> paths;

    [[nodiscard]] std::vector<std::string> to_strings() const;

    /// Sorted canonical strings of all paths joined by '/'; identifies the node for dedupe.
    [[nodiscard]] std::string canonical_key() const;

    /// Same set of paths, in any order.
    bool operator==(const PathSpec& other) const;
};

/// Traversal-local side table of resolved paths, keyed by NodeInfo::index.
class YDELTA_API PathAnnotations {
public:
    void set(std::size_t index, PathSpec spec);
    [[nodiscard]] const PathSpec* find(std::size_t index) const;
    void clear() noexcept { specs_.clear(); }

private:
    std::vector<std::optional<PathSpec>> specs_;
};

[[nodiscard]] YDELTA_API PathSpec node_root_path(const std::vector<SchemaPath>& schema_paths);

[[nodiscard]] YDELTA_API PathSpec node_child_path(const PathSpec& parent,
                                                  const std::vector<SchemaPath>& schema_paths);

/// @throws DiffError(MissingAncestorAnnotation) if the list has no resolved path
/// @throws DiffError(InvalidKeyMap | KeyStringFailure) if the entry's keys cannot be rendered
[[nodiscard]] YDELTA_API PathSpec node_list_entry_path(const Record& entry, const PathSpec& list);

/// @brief Resolve the paths of a visited node.
/// @param schema_paths aliases selected for the node's field (ignored for list entries)
/// @throws DiffError(MissingAncestorAnnotation) if the parent was never resolved
[[nodiscard]] YDELTA_API PathSpec resolve_node_path(const NodeInfo& node,
                                                    const std::vector<SchemaPath>& schema_paths,
                                                    const PathAnnotations& annotations);

} // namespace ydelta
