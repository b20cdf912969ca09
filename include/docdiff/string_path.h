// string_path.h - Registry path strings (RFC 6901 JSON Pointer style)

#pragma once

#include <docdiff/api.h>

#include <string>
#include <string_view>

namespace docdiff {

/// Path segment standing for "any element" of a sequence
inline constexpr std::string_view element_wildcard = "*";

/// @brief Append a mapping key to a path, escaping '~' and '/'
/// @example join_path("/metadata", "a/b") == "/metadata/a~1b"
[[nodiscard]] DOCDIFF_API std::string join_path(std::string_view parent, std::string_view key);

/// @brief Path of "any element" of the sequence at `parent`
/// @example element_path("/cells") == "/cells/*"
[[nodiscard]] DOCDIFF_API std::string element_path(std::string_view parent);

/// @brief Canonical form of a path: "" for the root, otherwise a leading
/// '/' and no trailing '/'. "/" and "" both denote the root.
/// @example normalize_path("cells/*/") == "/cells/*"
[[nodiscard]] DOCDIFF_API std::string normalize_path(std::string_view path);

} // namespace docdiff
