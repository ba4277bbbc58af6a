// test_schemas.cpp - Record schemas shared by the test suites

#include "test_schemas.h"

namespace test_schemas {

const EnumDescriptor example_enum{"EnumType", {{1, "ONE"}, {2, "TWO"}}};

const RecordSchema child_container{
    "RenderExample_Child",
    {
        FieldDescriptor::leaf("val", "val", LeafType::String),
    },
    {}};

const RecordSchema list_entry{
    "RenderExample_List",
    {
        FieldDescriptor::leaf("val", "val|config/val", LeafType::Int32),
        FieldDescriptor::leaf("description", "config/description", LeafType::String),
    },
    {"val"}};

const RecordSchema render_example{
    "RenderExample",
    {
        FieldDescriptor::annotation_field("annotation"),
        FieldDescriptor::leaf("str", "str", LeafType::String),
        FieldDescriptor::leaf("int-val", "int-val", LeafType::Int32),
        FieldDescriptor::leaf("floatval", "floatval", LeafType::Float),
        FieldDescriptor::enumeration("enum", "enum", example_enum),
        FieldDescriptor::container("ch", "ch", child_container),
        FieldDescriptor::leaf_list_of("leaf-list", "leaf-list", LeafType::Uint64),
        FieldDescriptor::leaf("union", "union", LeafType::Union),
        FieldDescriptor::leaf("binary", "binary", LeafType::Binary),
        FieldDescriptor::leaf("empty", "empty", LeafType::Empty),
        FieldDescriptor::leaf("two-path", "two-path|config/two-path", LeafType::String),
        FieldDescriptor::list("list", "list", list_entry),
    },
    {}};

const RecordSchema ordered_list_entry{
    "OrderedList",
    {
        FieldDescriptor::leaf("key", "config/key|key", LeafType::String),
        FieldDescriptor::leaf("value", "config/value", LeafType::String),
        FieldDescriptor::ordered_list("ordered-lists", "ordered-lists/ordered-list", ordered_list_entry),
    },
    {"key"}};

const RecordSchema multikeyed_entry{
    "OrderedMultikeyedList",
    {
        FieldDescriptor::leaf("key1", "config/key1|key1", LeafType::String),
        FieldDescriptor::leaf("key2", "config/key2|key2", LeafType::Uint64),
        FieldDescriptor::leaf("value", "config/value", LeafType::String),
    },
    {"key1", "key2"}};

const RecordSchema other_data{
    "OtherData",
    {
        FieldDescriptor::leaf("motd", "config/motd", LeafType::String),
    },
    {}};

const RecordSchema device{
    "Device",
    {
        FieldDescriptor::ordered_list("ordered-lists", "ordered-lists/ordered-list", ordered_list_entry),
        FieldDescriptor::ordered_list("ordered-multikeyed-lists",
                                      "ordered-multikeyed-lists/ordered-multikeyed-list",
                                      multikeyed_entry),
        FieldDescriptor::container("other-data", "other-data", other_data),
    },
    {}};

const RecordSchema shadow_example{
    "ShadowExample",
    {
        FieldDescriptor::leaf("mtu", "config/mtu", LeafType::Uint16).with_shadow_paths("state/mtu"),
        FieldDescriptor::leaf("counter", "state/counter", LeafType::Uint64),
    },
    {}};

const RecordSchema pathless{
    "Pathless",
    {
        FieldDescriptor::leaf("orphan", "", LeafType::String),
    },
    {}};

const RecordSchema float_key_entry{
    "FloatKeyed",
    {
        FieldDescriptor::leaf("weight", "config/weight|weight", LeafType::Float),
    },
    {"weight"}};

const RecordSchema float_key_root{
    "FloatKeyRoot",
    {
        FieldDescriptor::list("weights", "weights/weight", float_key_entry),
    },
    {}};

const RecordSchema colliding_child{
    "CollidingChild",
    {
        FieldDescriptor::leaf("inner", "inner", LeafType::String),
    },
    {}};

const RecordSchema leaf_then_container{
    "LeafThenContainer",
    {
        FieldDescriptor::leaf("first", "x", LeafType::String),
        FieldDescriptor::container("second", "x", colliding_child),
    },
    {}};

const RecordSchema container_then_leaf{
    "ContainerThenLeaf",
    {
        FieldDescriptor::container("first", "x", colliding_child),
        FieldDescriptor::leaf("second", "x", LeafType::String),
    },
    {}};

} // namespace test_schemas
