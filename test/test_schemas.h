// test_schemas.h - Record schemas shared by the test suites

#pragma once

#include <ydelta/builders.h>
#include <ydelta/schema.h>
#include <ydelta/value.h>

namespace test_schemas {

using namespace ydelta;

/// ONE = 1, TWO = 2; 0 means unset
extern const EnumDescriptor example_enum;

/// Container "ch" of RenderExample: leaf "val" at "val"
extern const RecordSchema child_container;

/// Entry of RenderExample's unordered list, keyed by "val" ("val|config/val")
extern const RecordSchema list_entry;

/// Scalars of every kind, a container, a list and an annotation field
extern const RecordSchema render_example;

/// Entry of "ordered-lists/ordered-list", keyed by "key"; holds a nested list of itself
extern const RecordSchema ordered_list_entry;

/// Entry of "ordered-multikeyed-lists/ordered-multikeyed-list", keyed by key1 (string), key2 (uint64)
extern const RecordSchema multikeyed_entry;

/// Container "other-data" with "config/motd"
extern const RecordSchema other_data;

/// Root with ordered lists, used by the atomic diff tests
extern const RecordSchema device;

/// Leaves with "config/..." primary and "state/..." shadow paths
extern const RecordSchema shadow_example;

/// A field that declares no schema path
extern const RecordSchema pathless;

/// Unordered list whose key is a float leaf
extern const RecordSchema float_key_entry;
extern const RecordSchema float_key_root;

/// Two fields sharing the alias "x"; the container holds leaf "inner"
extern const RecordSchema colliding_child;
extern const RecordSchema leaf_then_container;
extern const RecordSchema container_then_leaf;

// ============================================================
// Helper Functions
// ============================================================

inline Record ordered_entry(const std::string& key, const std::string& value)
{
    return RecordBuilder(ordered_list_entry)
        .set("key", key)
        .set("value", value)
        .finish();
}

inline Record multikeyed(const std::string& key1, std::uint64_t key2, const std::string& value)
{
    return RecordBuilder(multikeyed_entry)
        .set("key1", key1)
        .set("key2", key2)
        .set("value", value)
        .finish();
}

/// Device with the given ordered list entries (none: list unset)
inline Record device_with(std::initializer_list<Record> entries)
{
    OrderedListBuilder list;
    for (const auto& e : entries) {
        list.append(e);
    }
    RecordBuilder b(device);
    if (list.size() > 0) {
        b.set("ordered-lists", list.finish());
    }
    return b.finish();
}

inline Record list_member(std::int32_t val)
{
    return RecordBuilder(list_entry).set("val", val).finish();
}

} // namespace test_schemas
