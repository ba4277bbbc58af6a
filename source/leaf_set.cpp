// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// leaf_set.cpp - Set leaf extraction

#include <ydelta/leaf_set.h>
#include <ydelta/errors.h>
#include <ydelta/walk.h>

#include <unordered_set>

namespace ydelta {

SchemaPath least_specific_path(const std::vector<SchemaPath>& paths)
{
    const SchemaPath* shortest = nullptr;
    for (const auto& p : paths) {
        if (!shortest || p.size() < shortest->size()) {
            shortest = &p;
        }
    }
    return shortest ? *shortest : SchemaPath{};
}

bool is_unset_leaf(const LeafValue& val, const FieldDescriptor& field)
{
    const LeafValue& v = val.unwrapped();
    if (v.is_null()) {
        return true;
    }
    if (const auto* list = v.get_if<LeafList>()) {
        return list->empty();
    }
    if (const auto* e = v.get_if<EnumValue>()) {
        return e->value == 0;
    }
    if (field.leaf_type == LeafType::Empty) {
        const auto* b = v.get_if<bool>();
        return b && !*b;
    }
    return false;
}

namespace {

class LeafExtractor {
public:
    LeafExtractor(bool ordered_list_as_leaf, const DiffOptions& opts)
        : ordered_list_as_leaf_(ordered_list_as_leaf), opts_(opts) {}

    IterationAction visit(const NodeInfo& ni)
    {
        const FieldDescriptor& fd = *ni.field;
        if (fd.annotation) {
            return IterationAction::Continue;
        }

        std::vector<SchemaPath> aliases =
            (opts_.prefer_shadow_path && !fd.shadow_paths.empty()) ? fd.shadow_paths : fd.paths;
        if (aliases.empty()) {
            throw DiffError(DiffErrorCode::MissingSchemaPath, "invalid schema path for field " + fd.name);
        }
        if (opts_.map_to_single_path) {
            aliases = {least_specific_path(aliases)};
        }

        PathSpec spec = resolve_node_path(ni, aliases, annotations_);
        annotations_.set(ni.index, spec);

        // Another alias already produced the same paths.
        if (!processed_.insert(spec.canonical_key()).second) {
            return IterationAction::DoNotIterateDescendants;
        }

        if (ni.is_list_entry()) {
            return IterationAction::Continue;
        }

        const Node& node = *ni.value;
        if (const auto* ordered = node.get_if<OrderedList>()) {
            if (ordered->empty()) {
                return IterationAction::DoNotIterateDescendants;
            }
            if (!ordered_list_as_leaf_) {
                return IterationAction::Continue;
            }
            leaves_.push_back(LeafEntry{std::move(spec), node, &fd});
            return IterationAction::DoNotIterateDescendants;
        }

        const LeafValue* leaf = node.leaf();
        if (!leaf || is_unset_leaf(*leaf, fd)) {
            return IterationAction::Continue;
        }
        leaves_.push_back(LeafEntry{std::move(spec), node, &fd});
        return IterationAction::Continue;
    }

    LeafSet take() { return std::move(leaves_); }

private:
    bool ordered_list_as_leaf_;
    const DiffOptions& opts_;
    PathAnnotations annotations_;
    std::unordered_set<std::string> processed_;
    LeafSet leaves_;
};

} // anonymous namespace

LeafSet find_set_leaves(const Record& root, bool ordered_list_as_leaf, const DiffOptions& opts)
{
    LeafExtractor extractor{ordered_list_as_leaf, opts};
    for_each_data_field(root, [&](const NodeInfo& ni) { return extractor.visit(ni); });
    return extractor.take();
}

StringPathMap to_string_path_map(const LeafSet& leaves)
{
    StringPathMap out;
    for (const auto& leaf : leaves) {
        for (const auto& p : leaf.paths.paths) {
            out.insert_or_assign(path_to_string(p), PathInfo{p, leaf.value, leaf.field});
        }
    }
    return out;
}

} // namespace ydelta
