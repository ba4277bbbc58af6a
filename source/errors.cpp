// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <ydelta/errors.h>

namespace ydelta {

std::string_view error_code_name(DiffErrorCode code) noexcept
{
    switch (code) {
        case DiffErrorCode::Success:                   return "Success";
        case DiffErrorCode::TypeMismatch:              return "TypeMismatch";
        case DiffErrorCode::MissingSchemaPath:         return "MissingSchemaPath";
        case DiffErrorCode::MissingAncestorAnnotation: return "MissingAncestorAnnotation";
        case DiffErrorCode::InvalidKeyMap:             return "InvalidKeyMap";
        case DiffErrorCode::KeyStringFailure:          return "KeyStringFailure";
        case DiffErrorCode::ValueEncodingFailure:      return "ValueEncodingFailure";
        case DiffErrorCode::ValueDecodingFailure:      return "ValueDecodingFailure";
        case DiffErrorCode::NestedOrderedList:         return "NestedOrderedList";
        case DiffErrorCode::InvalidPath:               return "InvalidPath";
        case DiffErrorCode::UnknownPath:               return "UnknownPath";
        case DiffErrorCode::Internal:                  return "Internal";
    }
    return "Unknown";
}

} // namespace ydelta
