// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file docdiff_config.h
/// @brief Centralized compile-time configuration for docdiff and immer.
///
/// This file defines the compile-time settings used by docdiff:
///   - immer: persistent containers backing Value
///   - docdiff: logging and validation defaults
///
/// It MUST be included before any immer header to ensure consistent settings.
/// All docdiff public headers already include this file.
///
/// Runtime behaviour (alignment strategy, text differ, validation depth) is
/// selected per call through docdiff::DiffConfig, see diff_config.h.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(DOCDIFF_CONFIGURED)
#error "immer headers were included before docdiff/docdiff_config.h. " \
       "Please include docdiff headers before any direct immer includes."
#endif

#define DOCDIFF_CONFIGURED 1

// ============================================================
// Immer Settings
// ============================================================

/// @brief Keep immer's atomic reference counting.
///
/// Documents, registries and diffs are immutable and may be shared between
/// threads running independent diffs, so Value uses the thread-safe policy.
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 0
#endif

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

/// @brief Disable debug trace output
#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

/// @brief Disable debug print output
#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

/// @brief Disable deep data structure consistency checks
#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

// ============================================================
// Verbose Logging
//
// When DOCDIFF_VERBOSE_LOG is 1:
//   - Value::at() / Value::set() log access errors to stderr
//   - diff errors are logged at the raise site before being thrown
//
// Default: enabled in debug builds, disabled when NDEBUG is defined.
// ============================================================

#ifndef DOCDIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define DOCDIFF_VERBOSE_LOG 0
#  else
#    define DOCDIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Deep Validation Default
//
// Builders always validate the container level they produce. When
// DOCDIFF_DEEP_VALIDATE is 1, DiffConfig::deep_validate defaults to true and
// diff() additionally re-validates every result it returns against its
// source subtree.
// ============================================================

#ifndef DOCDIFF_DEEP_VALIDATE
#define DOCDIFF_DEEP_VALIDATE 0
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef DOCDIFF_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("docdiff: immer thread safety DISABLED")
#else
#pragma message("docdiff: immer thread safety ENABLED")
#endif

#if DOCDIFF_DEEP_VALIDATE
#pragma message("docdiff: deep diff validation ENABLED by default")
#endif
#endif // DOCDIFF_CONFIG_VERBOSE
