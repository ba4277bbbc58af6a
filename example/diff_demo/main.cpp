// main.cpp
// Diff Demo - Computing change notifications between two configuration snapshots
//
// Builds two snapshots of a small network device model and prints:
//
// Part 1: diff()             - one flat notification, ordered lists flattened
// Part 2: diff_with_atomic() - ordered-by user lists republished atomically
// Part 3: apply_notifications() replays the changes onto the old snapshot
// Part 4: error reporting through the *_safe API

#include <ydelta/apply.h>
#include <ydelta/builders.h>
#include <ydelta/value_diff.h>

#include <iostream>
#include <string>

using namespace ydelta;

// ============================================================
// Device model
// ============================================================

namespace {

const EnumDescriptor admin_status{"AdminStatus", {{1, "UP"}, {2, "DOWN"}}};

const RecordSchema interface_schema{
    "Interface",
    {
        FieldDescriptor::leaf("name", "name|config/name", LeafType::String),
        FieldDescriptor::leaf("mtu", "config/mtu", LeafType::Uint16).with_shadow_paths("state/mtu"),
        FieldDescriptor::enumeration("admin-status", "config/admin-status", admin_status),
        FieldDescriptor::leaf_list_of("vlans", "config/vlans", LeafType::Uint16),
    },
    {"name"}};

const RecordSchema acl_entry_schema{
    "AclEntry",
    {
        FieldDescriptor::leaf("sequence-id", "sequence-id|config/sequence-id", LeafType::Uint32),
        FieldDescriptor::leaf("action", "config/action", LeafType::String),
    },
    {"sequence-id"}};

const RecordSchema system_schema{
    "System",
    {
        FieldDescriptor::leaf("hostname", "config/hostname", LeafType::String),
    },
    {}};

const RecordSchema device_schema{
    "Device",
    {
        FieldDescriptor::container("system", "system", system_schema),
        FieldDescriptor::list("interface", "interfaces/interface", interface_schema),
        FieldDescriptor::ordered_list("acl-entry", "acl/acl-entries/acl-entry", acl_entry_schema),
    },
    {}};

Record make_interface(const std::string& name, uint16_t mtu, int64_t status)
{
    return RecordBuilder(interface_schema)
        .set("name", name)
        .set("mtu", mtu)
        .set("admin-status", LeafValue::enumeration(admin_status, status))
        .finish();
}

Record make_acl_entry(uint32_t seq, const std::string& action)
{
    return RecordBuilder(acl_entry_schema)
        .set("sequence-id", seq)
        .set("action", action)
        .finish();
}

void print_all(const std::vector<Notification>& notifications)
{
    for (const auto& n : notifications) {
        print_notification(n);
    }
}

} // namespace

int main()
{
    Record before = RecordBuilder(device_schema)
        .set("system", RecordBuilder(system_schema).set("hostname", "leaf-1").finish())
        .set("interface", UnorderedListBuilder()
                              .insert(make_interface("eth0", 1500, 1))
                              .insert(make_interface("eth1", 1500, 2))
                              .finish())
        .set("acl-entry", OrderedListBuilder()
                              .append(make_acl_entry(10, "permit"))
                              .append(make_acl_entry(20, "deny"))
                              .finish())
        .finish();

    Record after = RecordBuilder(before)
        .set("system", RecordBuilder(system_schema).set("hostname", "leaf-2").finish())
        .set("interface", UnorderedListBuilder()
                              .insert(RecordBuilder(make_interface("eth0", 9000, 1))
                                          .set("vlans", LeafValue::leaf_list({uint16_t{10}, uint16_t{20}}))
                                          .finish())
                              .finish())
        .set("acl-entry", OrderedListBuilder()
                              .append(make_acl_entry(20, "deny"))
                              .append(make_acl_entry(10, "permit"))
                              .append(make_acl_entry(30, "log"))
                              .finish())
        .finish();

    std::cout << "=== Part 1: diff ===\n";
    print_notification(diff(before, after));

    std::cout << "\n=== Part 2: diff_with_atomic ===\n";
    auto notifications = diff_with_atomic(before, after);
    print_all(notifications);

    std::cout << "\n=== Part 3: replay ===\n";
    Record replayed = apply_notifications(before, notifications);
    std::cout << "replayed snapshot " << (replayed == after ? "matches" : "DIFFERS FROM")
              << " the modified snapshot\n";

    std::cout << "\n=== Part 4: errors ===\n";
    Record bad = RecordBuilder(device_schema)
        .set("interface", UnorderedListBuilder()
                              .insert(make_interface("eth9", 1500, 7))
                              .finish())
        .finish();
    auto result = diff_safe(before, bad);
    if (!result) {
        std::cout << error_code_name(result.error_code) << ": " << result.error_message << "\n";
    }

    return replayed == after ? 0 : 1;
}
