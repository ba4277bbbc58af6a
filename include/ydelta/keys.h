// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file keys.h
/// @brief List key rendering: canonical key strings and key predicates.
///
/// A list entry's keys become the predicate of the last element of its wire
/// path, e.g. `interface[name=eth0]`. Key values are rendered as follows:
/// - enumeration: its name (an unnamed value fails)
/// - integers: decimal
/// - double: "%g" style
/// - string: as is
/// - bool: "true" / "false"
/// - binary: base64
/// - union: the member value
/// Anything else (float, leaf-list, unset) fails with KeyStringFailure.

#pragma once

#include "api.h"
#include "value.h"

#include <map>
#include <string>
#include <string_view>

namespace ydelta {

/// @throws DiffError(KeyStringFailure) for values with no canonical key string
[[nodiscard]] YDELTA_API std::string key_value_as_string(const LeafValue& val);

/// @brief Key predicate map of a list entry (key field name to key string).
/// @throws DiffError(InvalidKeyMap) if the entry has no keys
/// @throws DiffError(KeyStringFailure) if a key cannot be rendered
[[nodiscard]] YDELTA_API std::map<std::string, std::string> key_strings(const Record& entry);

/// @brief `[k1=v1][k2=v2]` predicate of a list entry, the key of an UnorderedList.
[[nodiscard]] YDELTA_API std::string list_key_string(const Record& entry);

[[nodiscard]] YDELTA_API std::string base64_encode(const Binary& data);

/// @throws DiffError(ValueDecodingFailure) on characters outside the base64 alphabet
[[nodiscard]] YDELTA_API Binary base64_decode(std::string_view text);

} // namespace ydelta
