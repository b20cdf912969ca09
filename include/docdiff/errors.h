// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception type raised by the structural differ.
///
/// Every failure of the diff engine is a deterministic function of its
/// inputs and configuration, so nothing is retried internally: errors are
/// thrown as diff_error and surfaced to the caller without a partial result.

#pragma once

#include "docdiff_config.h"
#include "api.h"

#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docdiff {

class diff_error : public std::runtime_error {
public:
    enum class error_type {
        unsupported_value_kind, // Input pair is not both-sequence, both-mapping or both-text
        unsupported_predicate,  // Matching-block alignment requested with a non-equality predicate
        predicate_conflict,     // Predicates configured for a path compared by plain equality
        malformed_diff          // Validator rejected an assembled diff
    };

    diff_error(error_type type, const std::string& message)
        : std::runtime_error(std::string(type_name(type)) + ": " + message), type_(type) {}

    error_type type() const noexcept { return type_; }

    static constexpr std::string_view type_name(error_type type) noexcept {
        switch (type) {
        case error_type::unsupported_value_kind:
            return "UnsupportedValueKind";
        case error_type::unsupported_predicate:
            return "UnsupportedPredicate";
        case error_type::predicate_conflict:
            return "PredicateConflict";
        case error_type::malformed_diff:
            return "MalformedDiff";
        default:
            return "DiffError";
        }
    }

private:
    error_type type_;
};

namespace detail {

/// Log (when DOCDIFF_VERBOSE_LOG) and throw a diff_error.
[[noreturn]] inline void raise_diff_error(
    diff_error::error_type type,
    const std::string& message,
    std::source_location loc = std::source_location::current())
{
#if DOCDIFF_VERBOSE_LOG
    std::cerr << "[" << diff_error::type_name(type) << "] " << message
              << " (raised at " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)loc;
#endif
    throw diff_error(type, message);
}

} // namespace detail

} // namespace docdiff
