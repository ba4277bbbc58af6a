// api.h - Shared library export/import macros for ydelta

#pragma once

/// @file api.h
/// @brief Cross-platform export/import macros for the ydelta library.
///
/// Usage:
/// - When building ydelta as a SHARED library:
///   - CMake defines YDELTA_EXPORTS (private) and YDELTA_SHARED (public)
///   - Functions/classes marked with YDELTA_API are exported
///
/// - When using ydelta as a SHARED library:
///   - Link against the ydelta target (CMake propagates YDELTA_SHARED)
///
/// - When building/using as a STATIC library:
///   - YDELTA_API expands to nothing

#if defined(_WIN32) || defined(_WIN64)
    #ifdef YDELTA_SHARED
        #ifdef YDELTA_EXPORTS
            #define YDELTA_API __declspec(dllexport)
        #else
            #define YDELTA_API __declspec(dllimport)
        #endif
    #else
        #define YDELTA_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(YDELTA_SHARED) && defined(YDELTA_EXPORTS)
        #define YDELTA_API __attribute__((visibility("default")))
    #else
        #define YDELTA_API
    #endif
#else
    #define YDELTA_API
#endif
