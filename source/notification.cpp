// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// notification.cpp - Notification comparison and printing

#include <ydelta/notification.h>

#include <iostream>
#include <map>
#include <set>
#include <sstream>

namespace ydelta {

namespace {

bool same_delete_set(const std::vector<Path>& a, const std::vector<Path>& b)
{
    std::set<std::string> lhs;
    std::set<std::string> rhs;
    for (const auto& p : a) lhs.insert(path_to_string(p));
    for (const auto& p : b) rhs.insert(path_to_string(p));
    return lhs == rhs;
}

bool same_update_set(const std::vector<Update>& a, const std::vector<Update>& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    std::multimap<std::string, const TypedValue*> lhs;
    for (const auto& u : a) {
        lhs.emplace(path_to_string(u.path), &u.val);
    }
    for (const auto& u : b) {
        auto [first, last] = lhs.equal_range(path_to_string(u.path));
        auto it = first;
        while (it != last && !(*it->second == u.val)) {
            ++it;
        }
        if (it == last) {
            return false;
        }
        lhs.erase(it);
    }
    return true;
}

} // anonymous namespace

bool notification_equal(const Notification& a, const Notification& b)
{
    if (a.atomic != b.atomic || a.prefix != b.prefix) {
        return false;
    }
    if (!same_delete_set(a.deletes, b.deletes)) {
        return false;
    }
    if (a.atomic) {
        return a.updates == b.updates;
    }
    return same_update_set(a.updates, b.updates);
}

bool notification_set_equal(const std::vector<Notification>& a, const std::vector<Notification>& b)
{
    if (a.size() != b.size()) {
        return false;
    }
    std::vector<bool> used(b.size(), false);
    for (const auto& n : a) {
        bool matched = false;
        for (std::size_t i = 0; i < b.size(); ++i) {
            if (!used[i] && notification_equal(n, b[i])) {
                used[i] = true;
                matched = true;
                break;
            }
        }
        if (!matched) {
            return false;
        }
    }
    return true;
}

std::string notification_to_string(const Notification& n)
{
    std::ostringstream oss;
    oss << "notification" << (n.atomic ? " (atomic)" : "");
    if (n.prefix) {
        oss << " prefix " << path_to_string(*n.prefix);
    }
    oss << "\n";
    if (n.empty()) {
        oss << "  (no changes)\n";
    }
    for (const auto& u : n.updates) {
        oss << "  UPDATE " << path_to_string(u.path) << ": " << typed_value_to_string(u.val) << "\n";
    }
    for (const auto& d : n.deletes) {
        oss << "  DELETE " << path_to_string(d) << "\n";
    }
    return oss.str();
}

void print_notification(const Notification& n)
{
    std::cout << notification_to_string(n);
}

} // namespace ydelta
