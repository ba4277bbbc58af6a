// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Error codes and the exception type raised by diff, encode and apply operations.

#pragma once

#include "api.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ydelta {

enum class DiffErrorCode : std::uint8_t {
    Success = 0,
    TypeMismatch,              // Snapshots are instances of different record schemas
    MissingSchemaPath,         // Field declares no schema path alias
    MissingAncestorAnnotation, // Parent path-set was never resolved
    InvalidKeyMap,             // List entry cannot produce its keys
    KeyStringFailure,          // Key value has no canonical string form
    ValueEncodingFailure,      // Leaf value cannot be represented as a TypedValue
    ValueDecodingFailure,      // TypedValue does not fit the field's leaf type
    NestedOrderedList,         // ordered-by user list inside an atomic group
    InvalidPath,               // Malformed path string or path operation
    UnknownPath,               // Path does not address any schema field
    Internal,
};

[[nodiscard]] YDELTA_API std::string_view error_code_name(DiffErrorCode code) noexcept;

/// @brief Exception raised by every throwing ydelta operation.
///
/// The message names the offending path or field; code() classifies it.
class YDELTA_API DiffError : public std::runtime_error {
public:
    DiffError(DiffErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] DiffErrorCode code() const noexcept { return code_; }

    /// Same code, message prefixed with additional context.
    [[nodiscard]] DiffError wrap(std::string_view context) const {
        return DiffError{code_, std::string(context) + ": " + what()};
    }

private:
    DiffErrorCode code_;
};

} // namespace ydelta
