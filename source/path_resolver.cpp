// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// path_resolver.cpp - Node path resolution

#include <ydelta/path_resolver.h>
#include <ydelta/errors.h>
#include <ydelta/keys.h>

#include <algorithm>

namespace ydelta {

// ============================================================
// PathSpec
// ============================================================

std::vector<std::string> PathSpec::to_strings() const
{
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        out.push_back(path_to_string(p));
    }
    return out;
}

std::string PathSpec::canonical_key() const
{
    auto strings = to_strings();
    std::ranges::sort(strings);
    std::string key;
    for (std::size_t i = 0; i < strings.size(); ++i) {
        if (i) key += '/';
        key += strings[i];
    }
    return key;
}

bool PathSpec::operator==(const PathSpec& other) const
{
    auto lhs = to_strings();
    auto rhs = other.to_strings();
    std::ranges::sort(lhs);
    std::ranges::sort(rhs);
    return lhs == rhs;
}

// ============================================================
// PathAnnotations
// ============================================================

void PathAnnotations::set(std::size_t index, PathSpec spec)
{
    if (index >= specs_.size()) {
        specs_.resize(index + 1);
    }
    specs_[index] = std::move(spec);
}

const PathSpec* PathAnnotations::find(std::size_t index) const
{
    if (index >= specs_.size() || !specs_[index]) {
        return nullptr;
    }
    return &*specs_[index];
}

// ============================================================
// Resolution
// ============================================================

PathSpec node_root_path(const std::vector<SchemaPath>& schema_paths)
{
    PathSpec spec;
    spec.paths.reserve(schema_paths.size());
    for (const auto& alias : schema_paths) {
        spec.paths.push_back(Path::from_schema_path(alias));
    }
    return spec;
}

PathSpec node_child_path(const PathSpec& parent, const std::vector<SchemaPath>& schema_paths)
{
    PathSpec spec;
    spec.paths.reserve(parent.paths.size() * schema_paths.size());
    for (const auto& base : parent.paths) {
        for (const auto& alias : schema_paths) {
            spec.paths.push_back(base.join(Path::from_schema_path(alias)));
        }
    }
    return spec;
}

PathSpec node_list_entry_path(const Record& entry, const PathSpec& list)
{
    if (list.paths.empty()) {
        throw DiffError(DiffErrorCode::MissingAncestorAnnotation,
                        "invalid list member with no parent: " +
                            (entry.schema ? entry.schema->name : std::string("<unknown>")));
    }

    const auto keys = key_strings(entry);

    PathSpec spec;
    spec.paths.reserve(list.paths.size());
    for (const auto& base : list.paths) {
        if (base.empty()) {
            throw DiffError(DiffErrorCode::InvalidPath, "list member has an empty parent path");
        }
        Path p = base;
        p.back().keys = keys;
        spec.paths.push_back(std::move(p));
    }
    return spec;
}

PathSpec resolve_node_path(const NodeInfo& node,
                           const std::vector<SchemaPath>& schema_paths,
                           const PathAnnotations& annotations)
{
    if (!node.parent) {
        return node_root_path(schema_paths);
    }

    const PathSpec* parent = annotations.find(*node.parent);
    if (!parent) {
        throw DiffError(DiffErrorCode::MissingAncestorAnnotation,
                        "could not find annotation for complete path of field " + node.field->name);
    }

    if (node.is_list_entry()) {
        return node_list_entry_path(*node.entry, *parent);
    }
    return node_child_path(*parent, schema_paths);
}

} // namespace ydelta
