// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file vdom_config.h
/// @brief Centralized configuration for vdom and its dependencies
///
/// This file defines the compile-time configuration for the third-party
/// libraries used by vdom:
///   - immer: persistent containers backing tree values and property maps
///
/// It MUST be included before any immer header so that every translation unit
/// sees the same memory policy. All vdom public headers include it first.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(VDOM_CONFIGURED)
#error "immer headers were included before vdom/vdom_config.h. " \
       "Please include vdom headers before any direct immer includes."
#endif

#define VDOM_CONFIGURED 1

// ============================================================
// Threading
// ============================================================

/// @brief Opt into immer's single-threaded policies
///
/// diff() may be called from any thread as long as the two input trees are
/// not shared with a concurrent caller, so the default keeps immer's atomic
/// reference counting. Hosts that only ever touch trees from one thread can
/// define VDOM_SINGLE_THREADED=1 to get:
/// - Non-atomic reference counting (faster inc/dec)
/// - Thread-unsafe free list heap (no locks)
#ifndef VDOM_SINGLE_THREADED
#define VDOM_SINGLE_THREADED 0
#endif

#if VDOM_SINGLE_THREADED && !defined(IMMER_NO_THREAD_SAFETY)
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

// ============================================================
// Immer Debug Settings (all disabled)
// ============================================================

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
// Verbose Logging
//
// When VDOM_VERBOSE_LOG is enabled, tolerated anomalies during patch
// application (reorder moves naming unknown keys, default warn callback)
// are written to stderr. Disabled in release builds by default.
// ============================================================

#ifndef VDOM_VERBOSE_LOG
#  if defined(NDEBUG)
#    define VDOM_VERBOSE_LOG 0
#  else
#    define VDOM_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef VDOM_CONFIG_VERBOSE
#if VDOM_SINGLE_THREADED
#pragma message("vdom: immer thread safety DISABLED (single-threaded)")
#else
#pragma message("vdom: immer thread safety ENABLED")
#endif
#if VDOM_VERBOSE_LOG
#pragma message("vdom: verbose logging ENABLED")
#endif
#endif // VDOM_CONFIG_VERBOSE
