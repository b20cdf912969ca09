// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file structural_diff.h
/// @brief Recursive structural differ for Value trees.
///
/// diff() dispatches on the kinds of its two inputs:
///   - sequence / sequence -> diff_lists()
///   - mapping / mapping   -> diff_dicts()
///   - text / text         -> DiffConfig::text_differ or diff_strings()
///   - anything else       -> diff_error (unsupported_value_kind)
///
/// Nested values are diffed through the differ registered for their path,
/// which defaults to diff() itself. A diff never contains a Patch with an
/// empty nested diff, and diff(a, a) is always empty.
///
/// Usage:
/// @code
///   auto a = from_json(R"({"x": [1, 2, 3], "y": "kitten"})");
///   auto b = from_json(R"({"x": [1, 3, 4], "y": "sitting"})");
///   Diff d = diff(a, b);
///   print_diff(d, std::cout);
/// @endcode

#pragma once

#include "api.h"
#include "diff_config.h"
#include "diff_format.h"
#include "path_registry.h"
#include "value.h"

#include <string>

namespace docdiff {

/// Everything except sequences, mappings and text
[[nodiscard]] DOCDIFF_API bool is_atomic(const Value& val) noexcept;

/// Diff two documents.
/// @param path     registry path of `a` and `b` ("" for the root)
/// @throws diff_error
[[nodiscard]] DOCDIFF_API Diff diff(const Value& a, const Value& b,
                                    const std::string& path = "",
                                    const PathRegistry& registry = PathRegistry::defaults(),
                                    const DiffConfig& config = DiffConfig{});

/// Diff two sequences. More than one predicate at `path` selects the
/// multilevel aligner; otherwise `shallow_diff` (when given) or a shallow
/// diff under the single predicate pairs the elements, and paired elements
/// that differ are diffed through the differ at `path + "/*"`.
/// @throws diff_error
[[nodiscard]] DOCDIFF_API Diff diff_lists(const ValueVector& a, const ValueVector& b,
                                          const std::string& path = "",
                                          const PathRegistry& registry = PathRegistry::defaults(),
                                          const DiffConfig& config = DiffConfig{},
                                          const Diff* shallow_diff = nullptr);

/// Diff two mappings, keys in sorted order.
/// @throws diff_error (predicate_conflict) when a shared key holding atomic
///         or mismatched values has predicates registered at `path` or at
///         the key's own path
[[nodiscard]] DOCDIFF_API Diff diff_dicts(const ValueMap& a, const ValueMap& b,
                                          const std::string& path = "",
                                          const PathRegistry& registry = PathRegistry::defaults(),
                                          const DiffConfig& config = DiffConfig{});

namespace detail {

/// Record the difference between two aligned elements at source `index`:
/// nothing when equal, a Patch through the differ at `element_path` when
/// both sides are containers or text of the same kind, a Replace otherwise.
DOCDIFF_API void diff_aligned_pair(SequenceDiffBuilder& builder, std::size_t index,
                                   const Value& a, const Value& b,
                                   const std::string& element_path,
                                   const PathRegistry& registry, const DiffConfig& config);

} // namespace detail

} // namespace docdiff
