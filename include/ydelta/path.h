// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Wire paths (gNMI style) and their canonical string form.
///
/// A Path is a sequence of PathElem; each element has a name and, for list
/// entries, a key predicate map. The canonical string renders each element
/// as `name[k1=v1][k2=v2]` with keys sorted by name, joined by '/', with a
/// leading '/':
///
/// @code
///   Path p = string_to_path("/interfaces/interface[name=eth0]/config/mtu");
///   p.size();                 // 4
///   p[1].keys.at("name");     // "eth0"
///   path_to_string(p);        // "/interfaces/interface[name=eth0]/config/mtu"
/// @endcode
///
/// Escaping uses '\':
/// - element names escape '/', '[', ']', '=' and '\'
/// - key names escape '=', ']' and '\'
/// - key values escape ']' and '\'
///
/// string_to_path() accepts exactly what path_to_string() produces, so
/// canonical strings round-trip.

#pragma once

#include "api.h"
#include "schema.h"

#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ydelta {

struct YDELTA_API PathElem {
    std::string name;
    std::map<std::string, std::string> keys;

    PathElem() = default;
    PathElem(std::string n) : name(std::move(n)) {}
    PathElem(const char* n) : name(n) {}
    PathElem(std::string n, std::map<std::string, std::string> k)
        : name(std::move(n)), keys(std::move(k)) {}

    bool operator==(const PathElem& other) const = default;
};

class YDELTA_API Path {
public:
    using container_type = std::vector<PathElem>;
    using const_iterator = container_type::const_iterator;

    Path() = default;
    Path(std::initializer_list<PathElem> elems) : elems_(elems) {}
    explicit Path(container_type elems) : elems_(std::move(elems)) {}

    /// Path made of the segments of a schema alias, without keys.
    [[nodiscard]] static Path from_schema_path(const SchemaPath& schema_path);

    [[nodiscard]] std::size_t size() const noexcept { return elems_.size(); }
    [[nodiscard]] bool empty() const noexcept { return elems_.empty(); }
    [[nodiscard]] const PathElem& operator[](std::size_t i) const { return elems_[i]; }
    [[nodiscard]] PathElem& operator[](std::size_t i) { return elems_[i]; }
    [[nodiscard]] const PathElem& back() const { return elems_.back(); }
    [[nodiscard]] PathElem& back() { return elems_.back(); }
    [[nodiscard]] const_iterator begin() const noexcept { return elems_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return elems_.end(); }
    [[nodiscard]] const container_type& elems() const noexcept { return elems_; }

    Path& push_back(PathElem elem) {
        elems_.push_back(std::move(elem));
        return *this;
    }

    /// Remove the last element.
    /// @throws DiffError(InvalidPath) if the path is empty
    void pop_back();

    /// Copy without the last element.
    /// @throws DiffError(InvalidPath) if the path is empty
    [[nodiscard]] Path parent() const;

    /// This path followed by all elements of suffix.
    [[nodiscard]] Path join(const Path& suffix) const;

    [[nodiscard]] bool has_prefix(const Path& prefix) const;

    /// This path relative to prefix.
    /// @throws DiffError(InvalidPath) if prefix is not a prefix of this path
    [[nodiscard]] Path strip_prefix(const Path& prefix) const;

    [[nodiscard]] std::string to_string() const;

    bool operator==(const Path& other) const = default;

private:
    container_type elems_;
};

/// @brief Render a path in canonical form ("/" for the empty path).
[[nodiscard]] YDELTA_API std::string path_to_string(const Path& path);

/// @brief Render one element as `name[k=v]...` with sorted, escaped keys.
[[nodiscard]] YDELTA_API std::string path_elem_to_string(const PathElem& elem);

/// @brief Render a key predicate map as `[k1=v1][k2=v2]`.
[[nodiscard]] YDELTA_API std::string key_predicate_string(const std::map<std::string, std::string>& keys);

/// @brief Parse a canonical path string. The leading '/' is optional.
/// @throws DiffError(InvalidPath) on malformed input
[[nodiscard]] YDELTA_API Path string_to_path(std::string_view text);

} // namespace ydelta
