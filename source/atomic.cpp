// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// atomic.cpp - Atomic notifications for ordered-by user lists

#include <ydelta/atomic.h>
#include <ydelta/errors.h>
#include <ydelta/keys.h>
#include <ydelta/leaf_set.h>

namespace ydelta {

namespace {

class AtomicLeafCollector {
public:
    explicit AtomicLeafCollector(bool prefer_shadow_path) : prefer_shadow_path_(prefer_shadow_path) {}

    void collect_entry(const Record& entry, const Path& list_path)
    {
        if (!entry.schema) {
            throw DiffError(DiffErrorCode::InvalidKeyMap,
                            "entry of list " + path_to_string(list_path) + " is not a record");
        }
        Path entry_path = list_path;
        entry_path.back().keys = key_strings(entry);
        collect_record(entry, entry_path);
    }

    std::vector<PathValue> take() { return std::move(leaves_); }

private:
    const std::vector<SchemaPath>& aliases_of(const FieldDescriptor& fd) const
    {
        if (prefer_shadow_path_ && !fd.shadow_paths.empty()) {
            return fd.shadow_paths;
        }
        if (fd.paths.empty()) {
            throw DiffError(DiffErrorCode::MissingSchemaPath, "invalid schema path for field " + fd.name);
        }
        return fd.paths;
    }

    void collect_record(const Record& rec, const Path& base)
    {
        for (const auto& fd : rec.schema->fields) {
            if (fd.annotation) {
                continue;
            }
            const Node* node = rec.find(fd.name);
            if (!node || node->is_null()) {
                continue;
            }

            if (node->is<OrderedList>()) {
                throw DiffError(DiffErrorCode::NestedOrderedList,
                                "detected nested `ordered-by user` list at field " + fd.name +
                                    " under " + path_to_string(base) + ", this is not supported");
            }

            for (const auto& alias : aliases_of(fd)) {
                Path p = base.join(Path::from_schema_path(alias));
                if (const auto* leaf = node->leaf()) {
                    if (!is_unset_leaf(*leaf, fd)) {
                        leaves_.push_back(PathValue{std::move(p), *leaf});
                    }
                } else if (const auto* child = node->record()) {
                    collect_record(*child, p);
                } else if (const auto* list = node->get_if<UnorderedList>()) {
                    for (const auto& [key, entry] : *list) {
                        collect_entry(entry.get(), p);
                    }
                }
            }
        }
    }

    bool prefer_shadow_path_;
    std::vector<PathValue> leaves_;
};

} // anonymous namespace

AtomicLeaves ordered_list_leaves(const OrderedList& list, const Path& list_path, bool prefer_shadow_path)
{
    AtomicLeaves result;
    result.prefix = list_path.parent();

    AtomicLeafCollector collector{prefer_shadow_path};
    for (const auto& entry : list.entries) {
        collector.collect_entry(entry.get(), list_path);
    }
    result.leaves = collector.take();
    return result;
}

std::optional<Notification> ordered_list_notification(const OrderedList& list,
                                                      const Path& list_path,
                                                      bool prefer_shadow_path)
{
    auto atomic_leaves = ordered_list_leaves(list, list_path, prefer_shadow_path);
    if (atomic_leaves.leaves.empty()) {
        return std::nullopt;
    }

    Notification n;
    n.atomic = true;
    n.prefix = atomic_leaves.prefix;
    n.updates.reserve(atomic_leaves.leaves.size());
    for (const auto& [path, value] : atomic_leaves.leaves) {
        try {
            n.updates.push_back(Update{path.strip_prefix(atomic_leaves.prefix), encode_typed_value(value)});
        } catch (const DiffError& e) {
            throw e.wrap("cannot represent field value " + value_to_string(value) +
                         " as TypedValue for path " + path_to_string(path));
        }
    }
    return n;
}

} // namespace ydelta
