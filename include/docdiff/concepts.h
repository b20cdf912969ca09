// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for type constraints in docdiff.
///
/// This file provides concepts for compile-time type checking, enabling:
/// - Better error messages when template constraints are violated
/// - Documentation of type requirements for alignment callbacks
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstddef>
#include <type_traits>

namespace docdiff {

// ============================================================
// Callable Concepts
// ============================================================

/// Concept for binary relations on values (alignment predicates)
template<typename Fn, typename ValueType>
concept ValueRelation = std::invocable<Fn, const ValueType&, const ValueType&> &&
                        std::convertible_to<std::invoke_result_t<Fn, const ValueType&, const ValueType&>, bool>;

/// Concept for index relations used by the snake algorithms:
/// eq(i, j) tells whether a[i] and b[j] may be aligned.
template<typename Fn>
concept IndexRelation = std::invocable<Fn&, std::size_t, std::size_t> &&
                        std::convertible_to<std::invoke_result_t<Fn&, std::size_t, std::size_t>, bool>;

} // namespace docdiff
