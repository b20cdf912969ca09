// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_config.h
/// @brief Runtime configuration passed into every diff call.
///
/// Compile-time switches live in docdiff_config.h; this header holds the
/// per-call settings. A DiffConfig is a plain value: callers build one,
/// pass it by const reference, and the engine never stores or mutates it.
///
/// Usage:
/// @code
///   docdiff::DiffConfig config;
///   config.algorithm = docdiff::SequenceAlgorithm::Exhaustive;
///   auto d = docdiff::diff(a, b, "", registry, config);
/// @endcode

#pragma once

#include "docdiff_config.h"
#include "api.h"
#include "diff_format.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace docdiff {

/// Shallow sequence alignment strategy
enum class SequenceAlgorithm : uint8_t {
    Exhaustive,      // Full LCS table, O(nm) time and space, minimal
    ClassicLcs,      // Myers O((n+m)D), minimal
    LibraryAssisted  // Longest matching blocks, equality only, may be non-minimal
};

/// Canonical name: "exhaustive", "classic-lcs" or "library-assisted"
[[nodiscard]] DOCDIFF_API std::string_view to_string(SequenceAlgorithm algorithm) noexcept;

/// Parse a strategy name. Accepts the canonical names and the aliases
/// "bruteforce", "myers" and "difflib".
/// @throws std::invalid_argument for an unknown name
[[nodiscard]] DOCDIFF_API SequenceAlgorithm parse_sequence_algorithm(std::string_view name);

/// Character-level differ for text leaves. Must return a text diff
/// (index keys into the source string, one-character payloads).
using TextDiffer = std::function<Diff(const std::string&, const std::string&)>;

struct DiffConfig {
    /// Strategy for every single-predicate sequence alignment
    SequenceAlgorithm algorithm = SequenceAlgorithm::ClassicLcs;

    /// Leaf differ for text; the built-in diff_strings when empty
    TextDiffer text_differ;

    /// Run validate_diff() on every diff() result against its source
    bool deep_validate = DOCDIFF_DEEP_VALIDATE != 0;
};

} // namespace docdiff
