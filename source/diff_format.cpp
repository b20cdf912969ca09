// diff_format.cpp - Diff entries, builders, validation and rendering

#include <docdiff/diff_format.h>
#include <docdiff/builders.h>
#include <docdiff/errors.h>

#include <algorithm>
#include <ostream>

namespace docdiff {

namespace {

[[noreturn]] void malformed(const std::string& message,
                            std::source_location loc = std::source_location::current())
{
    detail::raise_diff_error(diff_error::error_type::malformed_diff, message, loc);
}

std::string key_to_string(const PathElement& key)
{
    if (auto* name = std::get_if<std::string>(&key)) {
        return "'" + *name + "'";
    }
    return "[" + std::to_string(std::get<std::size_t>(key)) + "]";
}

ValueVector concat(const ValueVector& head, const ValueVector& tail)
{
    auto t = head.transient();
    for (const auto& box : tail) {
        t.push_back(box);
    }
    return t.persistent();
}

bool is_single_char(const Value& val)
{
    auto* s = val.get_if<std::string>();
    return s && s->size() == 1;
}

} // anonymous namespace

// ============================================================
// DiffEntry
// ============================================================

DiffEntry DiffEntry::add(std::string key, Value value)
{
    DiffEntry e;
    e.op = DiffOp::Add;
    e.key = std::move(key);
    e.value = std::move(value);
    return e;
}

DiffEntry DiffEntry::add_range(std::size_t key, ValueVector values)
{
    DiffEntry e;
    e.op = DiffOp::Add;
    e.key = key;
    e.values = std::move(values);
    return e;
}

DiffEntry DiffEntry::remove(std::string key)
{
    DiffEntry e;
    e.op = DiffOp::Remove;
    e.key = std::move(key);
    return e;
}

DiffEntry DiffEntry::remove_range(std::size_t key, std::size_t length)
{
    DiffEntry e;
    e.op = DiffOp::Remove;
    e.key = key;
    e.length = length;
    return e;
}

DiffEntry DiffEntry::replace(PathElement key, Value value)
{
    DiffEntry e;
    e.op = DiffOp::Replace;
    e.key = std::move(key);
    e.value = std::move(value);
    return e;
}

DiffEntry DiffEntry::patch(PathElement key, Diff diff)
{
    DiffEntry e;
    e.op = DiffOp::Patch;
    e.key = std::move(key);
    e.diff = std::move(diff);
    return e;
}

bool DiffEntry::operator==(const DiffEntry& other) const
{
    return op == other.op &&
           key == other.key &&
           value == other.value &&
           values == other.values &&
           length == other.length &&
           diff == other.diff;
}

std::string_view op_name(DiffOp op) noexcept
{
    switch (op) {
        case DiffOp::Add:     return "add";
        case DiffOp::Remove:  return "remove";
        case DiffOp::Replace: return "replace";
        case DiffOp::Patch:   return "patch";
    }
    return "unknown";
}

std::pair<std::size_t, std::size_t> count_consumed(const DiffEntry& entry)
{
    switch (entry.op) {
        case DiffOp::Add:     return {0, entry.values.size()};
        case DiffOp::Remove:  return {entry.length, 0};
        case DiffOp::Replace: return {1, 1};
        case DiffOp::Patch:   return {1, 1};
    }
    return {0, 0};
}

// ============================================================
// MappingDiffBuilder
// ============================================================

MappingDiffBuilder& MappingDiffBuilder::add(std::string key, Value value)
{
    entries_.push_back(DiffEntry::add(std::move(key), std::move(value)));
    return *this;
}

MappingDiffBuilder& MappingDiffBuilder::remove(std::string key)
{
    entries_.push_back(DiffEntry::remove(std::move(key)));
    return *this;
}

MappingDiffBuilder& MappingDiffBuilder::replace(std::string key, Value value)
{
    entries_.push_back(DiffEntry::replace(std::move(key), std::move(value)));
    return *this;
}

MappingDiffBuilder& MappingDiffBuilder::patch(std::string key, Diff diff)
{
    entries_.push_back(DiffEntry::patch(std::move(key), std::move(diff)));
    return *this;
}

Diff MappingDiffBuilder::validated()
{
    if (entries_.empty()) {
        return {};
    }
    // Stable: a duplicate key keeps its insertion order and is reported below
    std::stable_sort(entries_.begin(), entries_.end(),
                     [](const DiffEntry& l, const DiffEntry& r) { return l.key < r.key; });
    validate_mapping_diff(entries_);
    return std::move(entries_);
}

// ============================================================
// SequenceDiffBuilder
// ============================================================

SequenceDiffBuilder& SequenceDiffBuilder::add(std::size_t key, Value value)
{
    return add_range(key, ValueVector{}.push_back(ValueBox{std::move(value)}));
}

SequenceDiffBuilder& SequenceDiffBuilder::add_range(std::size_t key, ValueVector values)
{
    if (values.empty()) {
        return *this;
    }
    if (!entries_.empty()) {
        auto& last = entries_.back();
        if (last.op == DiffOp::Add && last.has_index() && last.index() == key) {
            last.values = concat(last.values, values);
            return *this;
        }
    }
    entries_.push_back(DiffEntry::add_range(key, std::move(values)));
    return *this;
}

SequenceDiffBuilder& SequenceDiffBuilder::remove(std::size_t key, std::size_t length)
{
    if (length == 0) {
        return *this;
    }
    if (!entries_.empty()) {
        auto& last = entries_.back();
        if (last.op == DiffOp::Remove && last.has_index() && last.index() + last.length == key) {
            last.length += length;
            return *this;
        }
    }
    entries_.push_back(DiffEntry::remove_range(key, length));
    return *this;
}

SequenceDiffBuilder& SequenceDiffBuilder::replace(std::size_t key, Value value)
{
    entries_.push_back(DiffEntry::replace(key, std::move(value)));
    return *this;
}

SequenceDiffBuilder& SequenceDiffBuilder::patch(std::size_t key, Diff diff)
{
    entries_.push_back(DiffEntry::patch(key, std::move(diff)));
    return *this;
}

SequenceDiffBuilder& SequenceDiffBuilder::append(DiffEntry entry)
{
    if (entry.has_index()) {
        switch (entry.op) {
            case DiffOp::Add:
                return add_range(entry.index(), std::move(entry.values));
            case DiffOp::Remove:
                return remove(entry.index(), entry.length);
            case DiffOp::Replace:
            case DiffOp::Patch:
                break;
        }
    }
    // String keys are kept as-is and rejected by validated()
    entries_.push_back(std::move(entry));
    return *this;
}

Diff SequenceDiffBuilder::validated()
{
    if (entries_.empty()) {
        return {};
    }
    validate_sequence_diff(entries_, source_size_);
    return std::move(entries_);
}

// ============================================================
// Validation
// ============================================================

void validate_mapping_diff(const Diff& diff)
{
    const std::string* prev = nullptr;
    for (const auto& e : diff) {
        if (e.has_index()) {
            malformed("mapping diff entry has index key " + key_to_string(e.key));
        }
        const auto& key = e.name();
        if (prev && !(*prev < key)) {
            if (*prev == key) {
                malformed("mapping diff has more than one entry for key '" + key + "'");
            }
            malformed("mapping diff keys not sorted at '" + key + "'");
        }
        switch (e.op) {
            case DiffOp::Add:
                if (!e.values.empty()) {
                    malformed("mapping add at '" + key + "' carries a sequence run");
                }
                break;
            case DiffOp::Patch:
                if (e.diff.empty()) {
                    malformed("patch at '" + key + "' has an empty diff");
                }
                break;
            case DiffOp::Remove:
            case DiffOp::Replace:
                break;
        }
        prev = &key;
    }
}

void validate_sequence_diff(const Diff& diff, std::size_t source_size)
{
    std::size_t taken = 0;     // first source index not consumed yet
    std::size_t prev_key = 0;
    bool prev_was_add = false;

    for (std::size_t i = 0; i < diff.size(); ++i) {
        const auto& e = diff[i];
        if (!e.has_index()) {
            malformed("sequence diff entry has string key " + key_to_string(e.key));
        }
        const std::size_t k = e.index();
        if (i > 0 && k < prev_key) {
            malformed("sequence diff keys decrease: [" + std::to_string(k) +
                      "] after [" + std::to_string(prev_key) + "]");
        }
        if (k < taken) {
            malformed("sequence diff entry [" + std::to_string(k) +
                      "] overlaps source elements consumed up to [" + std::to_string(taken) + "]");
        }

        switch (e.op) {
            case DiffOp::Add:
                if (e.values.empty()) {
                    malformed("empty add run at [" + std::to_string(k) + "]");
                }
                if (k > source_size) {
                    malformed("add at [" + std::to_string(k) + "] beyond source length " +
                              std::to_string(source_size));
                }
                if (prev_was_add && prev_key == k) {
                    malformed("uncombined adds at [" + std::to_string(k) + "]");
                }
                break;
            case DiffOp::Remove:
                if (e.length == 0) {
                    malformed("zero-length remove at [" + std::to_string(k) + "]");
                }
                if (k + e.length > source_size) {
                    malformed("remove of " + std::to_string(e.length) + " at [" + std::to_string(k) +
                              "] beyond source length " + std::to_string(source_size));
                }
                taken = k + e.length;
                break;
            case DiffOp::Replace:
                if (k >= source_size) {
                    malformed("replace at [" + std::to_string(k) + "] beyond source length " +
                              std::to_string(source_size));
                }
                taken = k + 1;
                break;
            case DiffOp::Patch:
                if (k >= source_size) {
                    malformed("patch at [" + std::to_string(k) + "] beyond source length " +
                              std::to_string(source_size));
                }
                if (e.diff.empty()) {
                    malformed("patch at [" + std::to_string(k) + "] has an empty diff");
                }
                taken = k + 1;
                break;
        }
        prev_key = k;
        prev_was_add = (e.op == DiffOp::Add);
    }
}

void validate_diff(const Diff& diff, const Value& source)
{
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, ValueMap>) {
            validate_mapping_diff(diff);
            for (const auto& e : diff) {
                const auto* child = arg.find(e.name());
                if (e.op == DiffOp::Add) {
                    if (child) {
                        malformed("add of existing key '" + e.name() + "'");
                    }
                    continue;
                }
                if (!child) {
                    malformed(std::string(op_name(e.op)) + " of missing key '" + e.name() + "'");
                }
                if (e.op == DiffOp::Patch) {
                    validate_diff(e.diff, child->get());
                }
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            validate_sequence_diff(diff, arg.size());
            for (const auto& e : diff) {
                if (e.op == DiffOp::Patch) {
                    validate_diff(e.diff, arg[e.index()].get());
                }
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            validate_sequence_diff(diff, arg.size());
            for (const auto& e : diff) {
                switch (e.op) {
                    case DiffOp::Add:
                        for (const auto& box : e.values) {
                            if (!is_single_char(*box)) {
                                malformed("text add at [" + std::to_string(e.index()) +
                                          "] carries a non-character value");
                            }
                        }
                        break;
                    case DiffOp::Replace:
                        if (!is_single_char(e.value)) {
                            malformed("text replace at [" + std::to_string(e.index()) +
                                      "] carries a non-character value");
                        }
                        break;
                    case DiffOp::Patch:
                        malformed("text diff contains a patch at [" + std::to_string(e.index()) + "]");
                    case DiffOp::Remove:
                        break;
                }
            }
        } else {
            if (!diff.empty()) {
                malformed("non-empty diff applied to " + std::string(kind_name(source.kind())) + " value");
            }
        }
    }, source.data);
}

// ============================================================
// Rendering
// ============================================================

Value to_value(const Diff& diff)
{
    VectorBuilder result;
    for (const auto& e : diff) {
        MapBuilder node;
        node.set("op", std::string(op_name(e.op)));
        if (e.has_index()) {
            node.set("key", static_cast<int64_t>(e.index()));
        } else {
            node.set("key", e.name());
        }
        switch (e.op) {
            case DiffOp::Add:
                if (e.has_index()) {
                    node.set("values", Value{e.values});
                } else {
                    node.set("value", e.value);
                }
                break;
            case DiffOp::Remove:
                if (e.has_index()) {
                    node.set("length", static_cast<int64_t>(e.length));
                }
                break;
            case DiffOp::Replace:
                node.set("value", e.value);
                break;
            case DiffOp::Patch:
                node.set("diff", to_value(e.diff));
                break;
        }
        result.push_back(node.finish());
    }
    return result.finish();
}

void print_diff(const Diff& diff, std::ostream& out, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    if (diff.empty() && depth == 0) {
        out << "  (no changes)\n";
        return;
    }
    for (const auto& e : diff) {
        out << indent;
        switch (e.op) {
            case DiffOp::Add:     out << "ADD     "; break;
            case DiffOp::Remove:  out << "REMOVE  "; break;
            case DiffOp::Replace: out << "REPLACE "; break;
            case DiffOp::Patch:   out << "PATCH   "; break;
        }
        out << key_to_string(e.key);
        switch (e.op) {
            case DiffOp::Add:
                if (e.has_index()) {
                    out << ":";
                    for (const auto& box : e.values) {
                        out << " " << value_to_string(*box);
                    }
                } else {
                    out << ": " << value_to_string(e.value);
                }
                break;
            case DiffOp::Remove:
                if (e.has_index() && e.length > 1) {
                    out << " x" << e.length;
                }
                break;
            case DiffOp::Replace:
                out << ": " << value_to_string(e.value);
                break;
            case DiffOp::Patch:
                out << "\n";
                print_diff(e.diff, out, depth + 1);
                continue;
        }
        out << "\n";
    }
}

} // namespace docdiff
