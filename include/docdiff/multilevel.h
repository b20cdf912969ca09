// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file multilevel.h
/// @brief Alignment with several predicates, strictest first.
///
/// Level 0 aligns the full sequences. Every gap left between its matched
/// runs is aligned again with the next predicate, and so on. A pair matched
/// at a stricter level is never revisited, so the result prefers identity
/// and falls back to similarity only where identity found nothing.
///
/// Example with predicates [equality, same "id" field]:
/// @code
///   a = [{id:1,v:0}, {id:2,v:0}, {id:3,v:0}]
///   b = [{id:1,v:0}, {id:2,v:9}, {id:3,v:0}]
///   level 0 matches (0,0) and (2,2); level 1 matches (1,1) in the gap
///   diff = [ Patch(1, [Replace("v", 9)]) ]
/// @endcode

#pragma once

#include "api.h"
#include "diff_config.h"
#include "diff_format.h"
#include "path_registry.h"
#include "predicate.h"
#include "sequence_algorithms.h"
#include "value.h"

#include <string>

namespace docdiff {

/// Merged alignment over all levels of `predicates`.
/// @throws diff_error (unsupported_predicate) for LibraryAssisted with a
///         non-equality level
/// @throws std::invalid_argument when `predicates` is empty
[[nodiscard]] DOCDIFF_API SnakeList compute_snakes_multilevel(const ValueVector& a, const ValueVector& b,
                                                              const PredicateList& predicates,
                                                              SequenceAlgorithm algorithm = SequenceAlgorithm::ClassicLcs);

/// Turn an alignment into a diff: gaps as in diff_sequence(), aligned pairs
/// that are not equal patched through the differ at `path + "/*"` (or
/// replaced when both are atomic).
/// @throws diff_error (malformed_diff) when `snakes` is not a valid alignment
[[nodiscard]] DOCDIFF_API Diff diff_from_snakes(const ValueVector& a, const ValueVector& b,
                                                const SnakeList& snakes,
                                                const std::string& path,
                                                const PathRegistry& registry,
                                                const DiffConfig& config);

/// Multilevel diff with explicit predicates
[[nodiscard]] DOCDIFF_API Diff diff_multilevel(const ValueVector& a, const ValueVector& b,
                                               const PredicateList& predicates,
                                               const std::string& path = "",
                                               const PathRegistry& registry = PathRegistry::defaults(),
                                               const DiffConfig& config = DiffConfig{});

/// Multilevel diff with the predicates registered at `path`
[[nodiscard]] DOCDIFF_API Diff diff_sequence_multilevel(const ValueVector& a, const ValueVector& b,
                                                        const std::string& path,
                                                        const PathRegistry& registry,
                                                        const DiffConfig& config = DiffConfig{});

} // namespace docdiff
