// string_path.cpp
// Path string helpers used by the path registry

#include <docdiff/string_path.h>

namespace docdiff {

namespace {

/// Escape a segment according to RFC 6901 conventions
/// ~ -> ~0, / -> ~1
void append_escaped(std::string& out, std::string_view segment)
{
    for (char c : segment) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
}

} // anonymous namespace

std::string join_path(std::string_view parent, std::string_view key)
{
    std::string result{parent};
    result.reserve(parent.size() + key.size() + 1);
    result += '/';
    append_escaped(result, key);
    return result;
}

std::string element_path(std::string_view parent)
{
    std::string result{parent};
    result += '/';
    result += element_wildcard;
    return result;
}

std::string normalize_path(std::string_view path)
{
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    if (path.empty()) {
        return "";  // Root reference
    }
    if (path.front() == '/') {
        return std::string{path};
    }
    return "/" + std::string{path};
}

} // namespace docdiff
