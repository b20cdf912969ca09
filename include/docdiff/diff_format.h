// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file diff_format.h
/// @brief Diff result model: entries, per-level builders and the validator.
///
/// A Diff is the edit script of ONE container level. Nested changes are
/// expressed with Patch entries carrying the diff of the child.
///
/// Mapping diffs (string keys):
///   - sorted by key, at most one entry per key
///   - Add(key, value), Remove(key), Replace(key, value), Patch(key, diff)
///
/// Sequence diffs (size_t keys = source indices), also used for text:
///   - keys non-decreasing; at one key an Add run may precede at most one
///     consuming entry (Remove, Replace or Patch)
///   - Add(key, values)      inserts a run before source index `key`
///   - Remove(key, length)   deletes `length` source elements from `key`
///   - Replace(key, value)   replaces one source element
///   - Patch(key, diff)      recurses into one source element
///   - source positions not mentioned are kept and pair up, in order, with
///     the unmentioned target positions
///
/// Example: [1, 2, 3] -> [0, 1, 3, 4]
/// @code
///   [ Add(0, [0]), Remove(1, 1), Add(3, [4]) ]
/// @endcode

#pragma once

#include "api.h"
#include "value.h"

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docdiff {

enum class DiffOp : uint8_t { Add, Remove, Replace, Patch };

struct DiffEntry;

/// Ordered edit script for one container level
using Diff = std::vector<DiffEntry>;

struct DOCDIFF_API DiffEntry {
    DiffOp op = DiffOp::Add;
    PathElement key;            // std::string for mappings, std::size_t for sequences and text
    Value value;                // Add (mapping), Replace
    ValueVector values;         // Add (sequence): the inserted run
    std::size_t length = 0;     // Remove (sequence): number of removed elements
    Diff diff;                  // Patch: nested diff of the element at `key`

    [[nodiscard]] static DiffEntry add(std::string key, Value value);
    [[nodiscard]] static DiffEntry add_range(std::size_t key, ValueVector values);
    [[nodiscard]] static DiffEntry remove(std::string key);
    [[nodiscard]] static DiffEntry remove_range(std::size_t key, std::size_t length);
    [[nodiscard]] static DiffEntry replace(PathElement key, Value value);
    [[nodiscard]] static DiffEntry patch(PathElement key, Diff diff);

    [[nodiscard]] bool has_index() const noexcept { return std::holds_alternative<std::size_t>(key); }
    [[nodiscard]] std::size_t index() const { return std::get<std::size_t>(key); }
    [[nodiscard]] const std::string& name() const { return std::get<std::string>(key); }

    bool operator==(const DiffEntry& other) const;
};

/// Printable name of an operation ("add", "remove", "replace", "patch")
[[nodiscard]] DOCDIFF_API std::string_view op_name(DiffOp op) noexcept;

/// Number of (source, target) elements a sequence entry consumes:
/// Add (0, n), Remove (n, 0), Replace and Patch (1, 1).
[[nodiscard]] DOCDIFF_API std::pair<std::size_t, std::size_t> count_consumed(const DiffEntry& entry);

// ============================================================
// Builders
// ============================================================

/// Accumulates the entries of one mapping level.
///
/// Entries may be added in any order; validated() sorts them by key so the
/// result does not depend on the iteration order of the input maps.
class DOCDIFF_API MappingDiffBuilder {
public:
    MappingDiffBuilder& add(std::string key, Value value);
    MappingDiffBuilder& remove(std::string key);
    MappingDiffBuilder& replace(std::string key, Value value);
    MappingDiffBuilder& patch(std::string key, Diff diff);

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// Sort, validate and hand out the entries (empty when nothing changed).
    /// @throws diff_error (malformed_diff)
    [[nodiscard]] Diff validated();

private:
    Diff entries_;
};

/// Accumulates the entries of one sequence (or text) level.
///
/// Keys must be supplied in non-decreasing source order; order is part of
/// the meaning of a sequence diff and is never re-sorted. Consecutive adds
/// at the same key are merged into one run, and a remove that starts where
/// the previous remove ended extends it.
class DOCDIFF_API SequenceDiffBuilder {
public:
    explicit SequenceDiffBuilder(std::size_t source_size) : source_size_(source_size) {}

    SequenceDiffBuilder& add(std::size_t key, Value value);
    SequenceDiffBuilder& add_range(std::size_t key, ValueVector values);
    SequenceDiffBuilder& remove(std::size_t key, std::size_t length = 1);
    SequenceDiffBuilder& replace(std::size_t key, Value value);
    SequenceDiffBuilder& patch(std::size_t key, Diff diff);

    /// Append an entry produced elsewhere (e.g. by a shallow alignment)
    SequenceDiffBuilder& append(DiffEntry entry);

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t source_size() const noexcept { return source_size_; }

    /// Validate and hand out the entries (empty when nothing changed).
    /// @throws diff_error (malformed_diff)
    [[nodiscard]] Diff validated();

private:
    std::size_t source_size_;
    Diff entries_;
};

// ============================================================
// Validation
// ============================================================

/// Check one mapping level: string keys, sorted, unique, well-formed payloads.
/// @throws diff_error (malformed_diff)
DOCDIFF_API void validate_mapping_diff(const Diff& diff);

/// Check one sequence level against the source length: index keys,
/// non-decreasing, in bounds, non-overlapping, no uncombined duplicates,
/// well-formed payloads.
/// @throws diff_error (malformed_diff)
DOCDIFF_API void validate_sequence_diff(const Diff& diff, std::size_t source_size);

/// Deep check of a diff against the document it applies to, recursing
/// through Patch entries into the matching children of `source`.
/// @throws diff_error (malformed_diff)
DOCDIFF_API void validate_diff(const Diff& diff, const Value& source);

// ============================================================
// Rendering
// ============================================================

/// Convert a diff to a Value tree:
///   [ {"op": "add", "key": ..., "value" | "values": ...},
///     {"op": "remove", "key": ..., ["length": n]},
///     {"op": "replace", "key": ..., "value": ...},
///     {"op": "patch", "key": ..., "diff": [...]} ]
/// Sequence keys become int64 values.
[[nodiscard]] DOCDIFF_API Value to_value(const Diff& diff);

/// Print a diff as an indented list of operations
DOCDIFF_API void print_diff(const Diff& diff, std::ostream& out, std::size_t depth = 0);

} // namespace docdiff
