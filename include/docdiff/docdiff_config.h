// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file docdiff_config.h
/// @brief Centralized compile-time configuration for docdiff and immer.
///
/// It MUST be included before any immer header so every translation unit
/// sees the same immer settings. All docdiff public headers include it
/// first, so users of docdiff headers don't need to do anything special.
///
/// Unlike a single-threaded editor state, comparison results may be
/// produced on several threads at once (one comparison per thread, each on
/// its own documents), so immer's thread-safe reference counting and free
/// list stay enabled.

#pragma once

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DOCDIFF_CONFIGURED)
#error "immer headers were included before docdiff/docdiff_config.h. " \
       "Please include docdiff headers before any direct immer includes."
#endif

#define DOCDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Disable tagged node assertions (smaller nodes, no tag checks)
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
// Verbose Logging
//
// When DOCDIFF_VERBOSE_LOG is non-zero, value accessors, file loading
// and policy validation report problems to stderr through the
// detail::log_* helpers (see value.h).
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// The comparison engine itself never logs.
// ============================================================

#ifndef DOCDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DOCDIFF_VERBOSE_LOG 0
#  else
#    define DOCDIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Resource limits
// ============================================================

/// @brief Default nesting limit for comparison and JSON parsing
#ifndef DOCDIFF_DEFAULT_MAX_DEPTH
#define DOCDIFF_DEFAULT_MAX_DEPTH 512
#endif

#ifdef DOCDIFF_CONFIG_VERBOSE
#if DOCDIFF_VERBOSE_LOG
#pragma message("docdiff: verbose logging ENABLED")
#else
#pragma message("docdiff: verbose logging DISABLED")
#endif
#endif
