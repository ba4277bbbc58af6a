// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// walk.cpp - Pre-order data tree traversal

#include <ydelta/walk.h>

namespace ydelta {

namespace {

class FieldWalker {
public:
    explicit FieldWalker(const FieldVisitor& visitor) : visitor_(visitor) {}

    void walk_record(const Record& rec, std::optional<std::size_t> parent)
    {
        if (!rec.schema) {
            return;
        }
        for (const auto& fd : rec.schema->fields) {
            const Node* node = rec.find(fd.name);
            NodeInfo info{next_index_++, parent, &fd, node ? node : &absent_, nullptr};
            if (visitor_(info) == IterationAction::DoNotIterateDescendants) {
                continue;
            }
            walk_children(info);
        }
    }

private:
    void walk_children(const NodeInfo& info)
    {
        const Node& node = *info.value;
        if (const auto* child = node.record()) {
            walk_record(*child, info.index);
        } else if (const auto* list = node.get_if<UnorderedList>()) {
            for (const auto& [key, entry] : *list) {
                walk_entry(info, entry.get());
            }
        } else if (const auto* ordered = node.get_if<OrderedList>()) {
            for (const auto& entry : ordered->entries) {
                walk_entry(info, entry.get());
            }
        }
    }

    void walk_entry(const NodeInfo& list_info, const Record& entry)
    {
        NodeInfo info{next_index_++, list_info.index, list_info.field, nullptr, &entry};
        if (visitor_(info) == IterationAction::DoNotIterateDescendants) {
            return;
        }
        walk_record(entry, info.index);
    }

    const FieldVisitor& visitor_;
    const Node absent_{};
    std::size_t next_index_ = 0;
};

} // anonymous namespace

void for_each_data_field(const Record& root, const FieldVisitor& visitor)
{
    FieldWalker walker{visitor};
    walker.walk_record(root, std::nullopt);
}

} // namespace ydelta
