// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file ydelta_config.h
/// @brief Compile-time configuration for ydelta and the libraries it wraps.
///
/// Settings covered here:
///   - immer: persistent containers backing every data tree snapshot
///   - boost: header-only utilities (base64 rendering of binary keys)
///   - ydelta: snapshot thread safety and diagnostic logging
///
/// It MUST be included before any immer header. All ydelta public headers
/// include it first, so users of ydelta headers don't need to do anything.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(YDELTA_CONFIGURED)
#error "immer headers were included before ydelta/ydelta_config.h. " \
       "Please include ydelta headers before any direct immer includes."
#endif

#define YDELTA_CONFIGURED 1

// ============================================================
// Snapshot Thread Safety
// ============================================================

/// @brief Select the memory policy used by data tree snapshots.
///
/// Diff calls never mutate their inputs, so one snapshot may be read by
/// several diff calls running on different threads. That requires atomic
/// reference counting in immer, which is the default here.
///
/// To trade that for single-threaded speed:
///   #define YDELTA_THREAD_SAFE_TREES 0
#ifndef YDELTA_THREAD_SAFE_TREES
#define YDELTA_THREAD_SAFE_TREES 1
#endif

#if !YDELTA_THREAD_SAFE_TREES && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes)
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking (MSVC); only header-only parts are used
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When YDELTA_VERBOSE_LOG is on, failures reported through the *_safe
// entry points, rejected builder writes and path parse errors are logged
// to stderr with the calling location.
//
// Default: on in debug builds, off when NDEBUG is defined.
// ============================================================

#ifndef YDELTA_VERBOSE_LOG
#  if defined(NDEBUG)
#    define YDELTA_VERBOSE_LOG 0
#  else
#    define YDELTA_VERBOSE_LOG 1
#  endif
#endif

#ifdef YDELTA_CONFIG_VERBOSE
#if YDELTA_THREAD_SAFE_TREES
#pragma message("ydelta: thread-safe snapshots ENABLED")
#else
#pragma message("ydelta: thread-safe snapshots DISABLED (single-thread refcounts)")
#endif
#endif // YDELTA_CONFIG_VERBOSE
