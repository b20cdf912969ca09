// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_registry.h
/// @brief Per-path alignment predicates and differ overrides.
///
/// Paths are registry keys, not document locations: "" is the root,
/// "/cells" the value under key "cells", "/cells/*" any element of that
/// sequence. Keys are escaped with ~0 / ~1 (see string_path.h).
///
/// A PathRegistry is immutable. Copies share one table, so a registry can
/// be passed down a recursion or across threads without cloning.
///
/// Usage:
/// @code
///   auto registry = PathRegistryBuilder{}
///       .predicates("/cells", {Predicate::equality(), same_source})
///       .differ("/cells/*", diff_cell)
///       .finish();
///   auto d = diff(a, b, "", registry);
/// @endcode

#pragma once

#include "api.h"
#include "diff_config.h"
#include "diff_format.h"
#include "predicate.h"
#include "value.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace docdiff {

class PathRegistry;

/// Recursion entry point for the elements at a path.
/// Same signature as docdiff::diff.
using Differ = std::function<Diff(const Value& a, const Value& b, const std::string& path,
                                  const PathRegistry& registry, const DiffConfig& config)>;

class DOCDIFF_API PathRegistry {
public:
    struct Entry {
        PredicateList predicates;  // empty: default [equality]
        Differ differ;             // empty: default docdiff::diff
    };

    /// Empty registry: every path resolves to the defaults
    PathRegistry();

    /// Ordered predicates at `path`, strictest first. Default: [equality].
    [[nodiscard]] const PredicateList& predicates_at(std::string_view path) const;

    /// Differ for values at `path`. Default: docdiff::diff.
    [[nodiscard]] const Differ& differ_at(std::string_view path) const;

    [[nodiscard]] bool has_predicates(std::string_view path) const;
    [[nodiscard]] bool has_differ(std::string_view path) const;

    [[nodiscard]] std::size_t size() const noexcept { return table_->size(); }
    [[nodiscard]] bool empty() const noexcept { return table_->empty(); }

    /// Shared empty registry
    [[nodiscard]] static const PathRegistry& defaults();

private:
    friend class PathRegistryBuilder;
    using table_type = std::map<std::string, Entry, std::less<>>;

    explicit PathRegistry(std::shared_ptr<const table_type> table);

    [[nodiscard]] const Entry* find(std::string_view path) const;

    std::shared_ptr<const table_type> table_;
};

/// Collects registry entries. Paths are normalized on insertion, so
/// "cells/*" and "/cells/*/" name the same entry. Registering a path twice
/// replaces the earlier setting of the same kind.
class DOCDIFF_API PathRegistryBuilder {
public:
    /// @throws std::invalid_argument when `predicates` is empty
    PathRegistryBuilder& predicates(std::string_view path, PredicateList predicates);

    /// @throws std::invalid_argument when `differ` is empty
    PathRegistryBuilder& differ(std::string_view path, Differ differ);

    [[nodiscard]] PathRegistry finish();

private:
    PathRegistry::table_type table_;
};

} // namespace docdiff
