// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file predicate.h
/// @brief Named similarity predicates used to align sequence elements.
///
/// A predicate decides whether two elements count as "the same element"
/// for alignment. Matched elements that are not equal are diffed further,
/// so a loose predicate turns add+remove pairs into patches.
///
/// Plain equality is a distinguished instance, so strategies that only work
/// with equality (matching blocks) can detect it.

#pragma once

#include "api.h"
#include "concepts.h"
#include "value.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace docdiff {

class DOCDIFF_API Predicate {
public:
    using function_type = std::function<bool(const Value&, const Value&)>;

    /// @throws std::invalid_argument when `fn` is empty
    Predicate(std::string name, function_type fn);

    /// Deep structural equality
    [[nodiscard]] static Predicate equality();

    [[nodiscard]] bool operator()(const Value& a, const Value& b) const
    {
        return fn_ ? fn_(a, b) : a == b;
    }

    [[nodiscard]] bool is_equality() const noexcept { return !fn_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    Predicate() : name_("equality") {}

    std::string name_;
    function_type fn_;  // empty for equality
};

/// Predicates for one path, strictest first
using PredicateList = std::vector<Predicate>;

/// Wrap any callable `(const Value&, const Value&) -> bool` as a Predicate
template<typename Fn>
    requires ValueRelation<Fn, Value>
[[nodiscard]] Predicate make_predicate(std::string name, Fn&& fn)
{
    return Predicate(std::move(name), Predicate::function_type(std::forward<Fn>(fn)));
}

} // namespace docdiff
