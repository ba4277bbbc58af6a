// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// apply.cpp - Replaying notifications onto a snapshot

#include <ydelta/apply.h>
#include <ydelta/errors.h>
#include <ydelta/keys.h>

#include <algorithm>
#include <optional>

namespace ydelta {

namespace {

enum class AliasMatch { None, Full, Partial };

/// Full: alias consumed from path[index]; Partial: path ends inside the alias.
AliasMatch match_alias(const SchemaPath& alias, const Path& path, std::size_t index, bool is_list)
{
    const std::size_t remaining = path.size() - index;
    const std::size_t n = std::min(alias.size(), remaining);
    for (std::size_t i = 0; i < n; ++i) {
        const PathElem& elem = path[index + i];
        if (elem.name != alias[i]) {
            return AliasMatch::None;
        }
        const bool keyed_segment = is_list && i + 1 == alias.size();
        if (!elem.keys.empty() && !keyed_segment) {
            return AliasMatch::None;
        }
    }
    return remaining >= alias.size() ? AliasMatch::Full : AliasMatch::Partial;
}

/// Applies one update (val set) or delete (val null) at a path.
class PathApplier {
public:
    PathApplier(const Path& path, const TypedValue* val) : path_(path), val_(val) {}

    Record apply(const Record& root)
    {
        if (path_.empty()) {
            if (val_) {
                fail(DiffErrorCode::UnknownPath, "cannot assign a value to the root");
            }
            return root.schema ? Record{*root.schema} : Record{};
        }
        return apply_at(root, 0);
    }

private:
    [[noreturn]] void fail(DiffErrorCode code, const std::string& reason) const
    {
        throw DiffError(code, "cannot " + std::string(val_ ? "update " : "delete ") +
                                  path_to_string(path_) + ": " + reason);
    }

    Record apply_at(const Record& rec, std::size_t index)
    {
        if (!rec.schema) {
            fail(DiffErrorCode::UnknownPath, "record has no schema");
        }

        const FieldDescriptor* best = nullptr;
        std::size_t best_len = 0;
        std::vector<const FieldDescriptor*> partial;

        for (const auto& fd : rec.schema->fields) {
            if (fd.annotation) {
                continue;
            }
            for (const auto* aliases : {&fd.paths, &fd.shadow_paths}) {
                for (const auto& alias : *aliases) {
                    switch (match_alias(alias, path_, index, fd.is_list())) {
                        case AliasMatch::Full:
                            if (alias.size() > best_len) {
                                best = &fd;
                                best_len = alias.size();
                            }
                            break;
                        case AliasMatch::Partial:
                            if (std::ranges::find(partial, &fd) == partial.end()) {
                                partial.push_back(&fd);
                            }
                            break;
                        case AliasMatch::None:
                            break;
                    }
                }
            }
        }

        if (best) {
            return apply_field(rec, *best, index + best_len - 1);
        }
        if (!val_ && !partial.empty()) {
            Record out = rec;
            for (const auto* fd : partial) {
                out = out.erase(fd->name);
            }
            return out;
        }
        fail(DiffErrorCode::UnknownPath,
             "no field of " + rec.schema->name + " matches " + path_elem_to_string(path_[index]));
    }

    LeafValue decode_leaf(const FieldDescriptor& fd) const
    {
        try {
            return decode_typed_value(*val_, fd);
        } catch (const DiffError& e) {
            throw e.wrap("cannot update " + path_to_string(path_));
        }
    }

    /// last: index of the path element holding the field's last alias segment
    Record apply_field(const Record& rec, const FieldDescriptor& fd, std::size_t last)
    {
        const bool at_end = last + 1 == path_.size();
        const Node* existing = rec.find(fd.name);

        switch (fd.kind) {
            case NodeKind::Leaf:
                if (!at_end) {
                    fail(DiffErrorCode::UnknownPath, "path continues below leaf " + fd.name);
                }
                if (!val_) {
                    return rec.erase(fd.name);
                }
                return rec.set(fd.name, Node{decode_leaf(fd)});

            case NodeKind::Container: {
                if (at_end) {
                    if (val_) {
                        fail(DiffErrorCode::UnknownPath, "cannot assign a value to container " + fd.name);
                    }
                    return rec.erase(fd.name);
                }
                const Record* child = existing ? existing->record() : nullptr;
                if (!child && !val_) {
                    return rec;
                }
                Record updated = apply_at(child ? *child : Record{*fd.record}, last + 1);
                return updated.empty() ? rec.erase(fd.name) : rec.set(fd.name, Node{std::move(updated)});
            }

            case NodeKind::UnorderedList:
            case NodeKind::OrderedList:
                if (path_[last].keys.empty()) {
                    if (at_end && !val_) {
                        return rec.erase(fd.name);
                    }
                    fail(DiffErrorCode::UnknownPath, "list " + fd.name + " addressed without key predicate");
                }
                if (at_end && val_) {
                    fail(DiffErrorCode::UnknownPath, "cannot assign a value to an entry of list " + fd.name);
                }
                return fd.kind == NodeKind::UnorderedList ? apply_unordered(rec, fd, existing, last)
                                                          : apply_ordered(rec, fd, existing, last);
        }
        fail(DiffErrorCode::Internal, "unknown node kind");
    }

    Record new_entry(const FieldDescriptor& fd, const std::map<std::string, std::string>& keys) const
    {
        const RecordSchema& schema = *fd.record;
        Record entry{schema};
        for (const auto& [name, text] : keys) {
            const FieldDescriptor* key_field = schema.field(name);
            if (!key_field || !key_field->is_leaf()) {
                fail(DiffErrorCode::UnknownPath, "list " + fd.name + " has no key field " + name);
            }
            try {
                entry = entry.set(name, Node{key_value_from_string(text, *key_field)});
            } catch (const DiffError& e) {
                throw e.wrap("cannot create entry for " + path_to_string(path_));
            }
        }
        return entry;
    }

    Record apply_unordered(const Record& rec, const FieldDescriptor& fd, const Node* existing, std::size_t last)
    {
        const auto& keys = path_[last].keys;
        const UnorderedList* current = existing ? existing->get_if<UnorderedList>() : nullptr;
        UnorderedList list = current ? *current : UnorderedList{};

        const std::string key = key_predicate_string(keys);
        const RecordBox* found = list.find(key);

        if (last + 1 == path_.size()) {
            if (!found) {
                return rec;
            }
            list = list.erase(key);
        } else {
            if (!found && !val_) {
                return rec;
            }
            Record updated = apply_at(found ? found->get() : new_entry(fd, keys), last + 1);
            list = updated.empty() ? list.erase(key) : list.set(key, RecordBox{std::move(updated)});
        }
        return list.empty() ? rec.erase(fd.name) : rec.set(fd.name, Node{std::move(list)});
    }

    Record apply_ordered(const Record& rec, const FieldDescriptor& fd, const Node* existing, std::size_t last)
    {
        const auto& keys = path_[last].keys;
        const OrderedList* current = existing ? existing->get_if<OrderedList>() : nullptr;
        OrderedList list = current ? *current : OrderedList{};

        std::optional<std::size_t> index;
        for (std::size_t i = 0; i < list.entries.size(); ++i) {
            if (key_strings(list.entries[i].get()) == keys) {
                index = i;
                break;
            }
        }

        std::optional<Record> updated;
        if (last + 1 < path_.size()) {
            if (!index && !val_) {
                return rec;
            }
            updated = apply_at(index ? list.entries[*index].get() : new_entry(fd, keys), last + 1);
            if (updated->empty()) {
                updated.reset();
            }
        } else if (!index) {
            return rec;
        }

        if (updated && index) {
            list.entries = list.entries.set(*index, RecordBox{std::move(*updated)});
        } else if (updated) {
            list.entries = list.entries.push_back(RecordBox{std::move(*updated)});
        } else if (index) {
            auto t = OrderedList::entry_vector{}.transient();
            for (std::size_t i = 0; i < list.entries.size(); ++i) {
                if (i != *index) {
                    t.push_back(list.entries[i]);
                }
            }
            list.entries = t.persistent();
        }
        return list.empty() ? rec.erase(fd.name) : rec.set(fd.name, Node{std::move(list)});
    }

    const Path& path_;
    const TypedValue* val_;
};

} // anonymous namespace

Record apply_update(const Record& root, const Path& path, const TypedValue& val)
{
    return PathApplier{path, &val}.apply(root);
}

Record apply_delete(const Record& root, const Path& path)
{
    return PathApplier{path, nullptr}.apply(root);
}

Record apply_notification(const Record& root, const Notification& n)
{
    const Path base = n.prefix.value_or(Path{});
    Record result = root;

    if (n.atomic) {
        result = apply_delete(result, base);
    }
    for (const auto& d : n.deletes) {
        result = apply_delete(result, base.join(d));
    }
    for (const auto& u : n.updates) {
        result = apply_update(result, base.join(u.path), u.val);
    }
    return result;
}

Record apply_notifications(const Record& root, const std::vector<Notification>& notifications)
{
    Record result = root;
    for (const auto& n : notifications) {
        result = apply_notification(result, n);
    }
    return result;
}

} // namespace ydelta
