// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value_diff.cpp - Snapshot comparison and notification assembly

#include <ydelta/value_diff.h>
#include <ydelta/atomic.h>
#include <ydelta/leaf_set.h>
#include <ydelta/log.h>

#include <set>

namespace ydelta {

namespace {

class NotificationDiffer {
public:
    NotificationDiffer(const DiffOptions& opts, bool with_atomic)
        : opts_(opts), with_atomic_(with_atomic) {}

    std::vector<Notification> run(const Record& original, const Record& modified)
    {
        if (original.schema != modified.schema) [[unlikely]] {
            throw DiffError(DiffErrorCode::TypeMismatch,
                            "cannot diff structs of different types, original: " + schema_name(original) +
                                ", modified: " + schema_name(modified));
        }

        const auto orig_leaves = extract(original, "original");
        const auto mod_leaves = extract(modified, "modified");

        for (const auto& [path, orig_info] : orig_leaves) {
            auto found = mod_leaves.find(path);
            if (found == mod_leaves.end()) {
                process_delete(orig_info);
                continue;
            }
            if (!(orig_info.value == found->second.value)) {
                process_update(found->second);
            }
        }

        if (!opts_.ignore_additions) {
            for (const auto& [path, mod_info] : mod_leaves) {
                if (!orig_leaves.contains(path)) {
                    process_update(mod_info);
                }
            }
        }

        return assemble();
    }

private:
    static std::string schema_name(const Record& r)
    {
        return r.schema ? r.schema->name : std::string("<none>");
    }

    StringPathMap extract(const Record& tree, std::string_view which) const
    {
        try {
            return to_string_path_map(find_set_leaves(tree, with_atomic_, opts_));
        } catch (const DiffError& e) {
            throw e.wrap("could not extract set leaves from " + std::string(which) + " tree");
        }
    }

    void process_update(const PathInfo& info)
    {
        if (const auto* ordered = info.value.get_if<OrderedList>()) {
            if (auto n = ordered_list_notification(*ordered, info.path, opts_.prefer_shadow_path)) {
                atomic_.push_back(std::move(*n));
            }
            return;
        }

        const LeafValue& leaf = *info.value.leaf();
        try {
            flat_.updates.push_back(Update{info.path, encode_typed_value(leaf)});
        } catch (const DiffError& e) {
            throw e.wrap("cannot represent field value " + value_to_string(leaf) +
                         " as TypedValue for path " + path_to_string(info.path));
        }
    }

    void process_delete(const PathInfo& info)
    {
        // A removed ordered list is reported as a leaf; its delete drops the trailing list segment
        if (info.value.is<OrderedList>()) {
            if (info.path.empty()) {
                throw DiffError(DiffErrorCode::InvalidPath,
                                "deletion path on ordered list is empty, this is unexpected");
            }
            append_delete(info.path.parent());
            return;
        }
        append_delete(info.path);
    }

    void append_delete(Path p)
    {
        if (deleted_.insert(path_to_string(p)).second) {
            flat_.deletes.push_back(std::move(p));
        }
    }

    std::vector<Notification> assemble()
    {
        std::vector<Notification> out = std::move(atomic_);
        if (!flat_.empty()) {
            out.push_back(std::move(flat_));
        }
        return out;
    }

    const DiffOptions& opts_;
    bool with_atomic_;
    Notification flat_;
    std::set<std::string> deleted_;
    std::vector<Notification> atomic_;
};

} // anonymous namespace

// ============================================================
// Public API
// ============================================================

Notification diff(const Record& original, const Record& modified, const DiffOptions& opts)
{
    auto notifications = NotificationDiffer{opts, false}.run(original, modified);
    if (notifications.empty()) {
        return Notification{};
    }
    if (notifications.size() > 1) [[unlikely]] {
        throw DiffError(DiffErrorCode::Internal,
                        "internal error: diff expected a single notification but got " +
                            std::to_string(notifications.size()));
    }
    return std::move(notifications.front());
}

std::vector<Notification> diff_with_atomic(const Record& original, const Record& modified,
                                           const DiffOptions& opts)
{
    return NotificationDiffer{opts, true}.run(original, modified);
}

DiffResult diff_safe(const Record& original, const Record& modified, const DiffOptions& opts)
{
    DiffResult result;
    try {
        result.notifications.push_back(diff(original, modified, opts));
        result.success = true;
    } catch (const DiffError& e) {
        result.error_code = e.code();
        result.error_message = e.what();
        detail::log_error("diff_safe", error_code_name(e.code()), e.what());
    }
    return result;
}

DiffResult diff_with_atomic_safe(const Record& original, const Record& modified, const DiffOptions& opts)
{
    DiffResult result;
    try {
        result.notifications = diff_with_atomic(original, modified, opts);
        result.success = true;
    } catch (const DiffError& e) {
        result.error_code = e.code();
        result.error_message = e.what();
        detail::log_error("diff_with_atomic_safe", error_code_name(e.code()), e.what());
    }
    return result;
}

} // namespace ydelta
