// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file log.h
/// @brief Diagnostic logging helpers, compiled away unless YDELTA_VERBOSE_LOG is on.

#pragma once

#include "ydelta_config.h"

#include <iostream>
#include <source_location> // for std::source_location (C++20)
#include <string_view>

namespace ydelta {

namespace detail {

inline void log_error(
    std::string_view func,
    std::string_view context,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if YDELTA_VERBOSE_LOG
    std::cerr << "[ydelta::" << func << "] " << context << ": " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)context;
    (void)reason;
    (void)loc;
#endif
}

inline void log_field_error(
    std::string_view func,
    std::string_view field,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if YDELTA_VERBOSE_LOG
    std::cerr << "[ydelta::" << func << "] field '" << field << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)field;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

} // namespace ydelta
