// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sequences.h
/// @brief Shallow sequence and text diffs.
///
/// A shallow diff only contains Add, Remove and Replace entries. Elements
/// aligned by the predicate are not mentioned, even when they are not equal;
/// diff_lists() walks the shallow diff and recurses into those pairs.

#pragma once

#include "api.h"
#include "diff_config.h"
#include "diff_format.h"
#include "predicate.h"
#include "sequence_algorithms.h"
#include "value.h"

#include <functional>
#include <string_view>

namespace docdiff {

/// Alignment of two sequences under `predicate`.
/// @throws diff_error (unsupported_predicate) for LibraryAssisted with a
///         predicate other than Predicate::equality()
[[nodiscard]] DOCDIFF_API SnakeList compute_snakes(const ValueVector& a, const ValueVector& b,
                                                   const Predicate& predicate,
                                                   SequenceAlgorithm algorithm = SequenceAlgorithm::ClassicLcs);

/// Shallow edit script turning `a` into `b`.
///
/// Each gap between aligned runs becomes a Replace when exactly one element
/// is removed and one added, otherwise an Add run followed by a Remove run,
/// both keyed at the gap's first source index.
/// @throws diff_error (unsupported_predicate), see compute_snakes()
[[nodiscard]] DOCDIFF_API Diff diff_sequence(const ValueVector& a, const ValueVector& b,
                                             const Predicate& predicate = Predicate::equality(),
                                             SequenceAlgorithm algorithm = SequenceAlgorithm::ClassicLcs);

/// Byte-level text diff; payloads are one-character strings.
[[nodiscard]] DOCDIFF_API Diff diff_strings(std::string_view a, std::string_view b,
                                            SequenceAlgorithm algorithm = SequenceAlgorithm::ClassicLcs);

namespace detail {

/// @throws diff_error (unsupported_predicate) when `algorithm` cannot
///         align with `predicate`
DOCDIFF_API void require_supported(const Predicate& predicate, SequenceAlgorithm algorithm);

/// Emit the entries for the unmatched rectangle [i0, i1) x [j0, j1)
DOCDIFF_API void emit_gap(SequenceDiffBuilder& builder,
                          std::size_t i0, std::size_t i1, std::size_t j0, std::size_t j1,
                          const std::function<Value(std::size_t)>& target_at);

/// @throws diff_error (malformed_diff) unless the snakes are in bounds,
///         non-empty and strictly increasing in both coordinates
DOCDIFF_API void check_snakes(const SnakeList& snakes, std::size_t n, std::size_t m);

} // namespace detail

} // namespace docdiff
