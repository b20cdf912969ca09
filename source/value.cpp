// value.cpp - Value type utilities

#include <docdiff/value.h>
#include <docdiff/builders.h>

#include <string>

namespace docdiff {

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:     return "null";
        case ValueKind::Boolean:  return "boolean";
        case ValueKind::Integer:  return "integer";
        case ValueKind::Real:     return "real";
        case ValueKind::Text:     return "text";
        case ValueKind::Mapping:  return "mapping";
        case ValueKind::Sequence: return "sequence";
    }
    return "unknown";
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg) + "L";
        } else if constexpr (std::is_same_v<T, double>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

// ============================================================
// Explicit Template Instantiations
//
// These instantiations generate the code for the templates declared
// 'extern template' in value.h and builders.h.
// ============================================================

template struct BasicValue<immer::default_memory_policy>;
template class BasicMapBuilder<immer::default_memory_policy>;
template class BasicVectorBuilder<immer::default_memory_policy>;

} // namespace docdiff
