// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON conversion for Value (documents and diffs rendered with to_value()).
///
/// Usage:
/// @code
///   #include <docdiff/serialization.h>
///
///   Value nb = from_json(R"({"cells": [], "metadata": {}})");
///   std::string text = to_json(nb, true);
/// @endcode
///
/// Map keys are written in sorted order, so the JSON text of a Value does
/// not depend on the hash order of the underlying immer::map.

#pragma once

#include "api.h"
#include "value.h"

#include <string>

namespace docdiff {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @return JSON string representation
///
/// Limitations:
/// - Doubles are written with 15 significant digits
DOCDIFF_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
///
/// Integers that fit in 32 bits become int32_t, larger ones int64_t,
/// numbers with a fraction or exponent become double.
DOCDIFF_API Value from_json(const std::string& json_str, std::string* error_out = nullptr);

} // namespace docdiff
