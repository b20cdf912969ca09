// structural_diff.cpp - Recursive differ for Value trees

#include <docdiff/structural_diff.h>
#include <docdiff/errors.h>
#include <docdiff/multilevel.h>
#include <docdiff/sequences.h>
#include <docdiff/string_path.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace docdiff {

namespace {

std::vector<const std::string*> sorted_keys(const ValueMap& map)
{
    std::vector<const std::string*> keys;
    keys.reserve(map.size());
    for (const auto& [k, v] : map) {
        keys.push_back(&k);
    }
    std::sort(keys.begin(), keys.end(),
              [](const std::string* l, const std::string* r) { return *l < *r; });
    return keys;
}

std::string describe_path(const std::string& path)
{
    return path.empty() ? "the root" : "'" + path + "'";
}

} // anonymous namespace

bool is_atomic(const Value& val) noexcept
{
    switch (val.kind()) {
        case ValueKind::Text:
        case ValueKind::Mapping:
        case ValueKind::Sequence:
            return false;
        default:
            return true;
    }
}

Diff diff(const Value& a, const Value& b,
          const std::string& path,
          const PathRegistry& registry,
          const DiffConfig& config)
{
    Diff result;

    if (auto* va = a.get_if<ValueVector>(); va && b.is_vector()) {
        result = diff_lists(*va, *b.get_if<ValueVector>(), path, registry, config);
    } else if (auto* ma = a.get_if<ValueMap>(); ma && b.is_map()) {
        result = diff_dicts(*ma, *b.get_if<ValueMap>(), path, registry, config);
    } else if (auto* sa = a.get_if<std::string>(); sa && b.is_string()) {
        const auto& sb = *b.get_if<std::string>();
        result = config.text_differ ? config.text_differ(*sa, sb)
                                    : diff_strings(*sa, sb, config.algorithm);
        // Text diffs are checked against the source even without deep validation
        if (!config.deep_validate) {
            validate_diff(result, a);
        }
    } else {
        detail::raise_diff_error(diff_error::error_type::unsupported_value_kind,
                                 "cannot diff " + std::string(kind_name(a.kind())) + " against " +
                                 std::string(kind_name(b.kind())) + " at " + describe_path(path));
    }

    if (config.deep_validate) {
        validate_diff(result, a);
    }
    return result;
}

namespace detail {

void diff_aligned_pair(SequenceDiffBuilder& builder, std::size_t index,
                       const Value& a, const Value& b,
                       const std::string& element_path,
                       const PathRegistry& registry, const DiffConfig& config)
{
    if (a == b) {
        return;
    }
    if (a.kind() == b.kind() && !is_atomic(a)) {
        Diff sub = registry.differ_at(element_path)(a, b, element_path, registry, config);
        if (!sub.empty()) {
            builder.patch(index, std::move(sub));
        }
        return;
    }
    builder.replace(index, b);
}

} // namespace detail

Diff diff_lists(const ValueVector& a, const ValueVector& b,
                const std::string& path,
                const PathRegistry& registry,
                const DiffConfig& config,
                const Diff* shallow_diff)
{
    const PredicateList& predicates = registry.predicates_at(path);
    if (predicates.size() > 1) {
        if (shallow_diff) {
            throw std::invalid_argument("diff_lists: shallow diff supplied for multilevel path " +
                                        describe_path(path));
        }
        return diff_sequence_multilevel(a, b, path, registry, config);
    }

    Diff computed;
    if (shallow_diff) {
        validate_sequence_diff(*shallow_diff, a.size());
    } else {
        computed = diff_sequence(a, b, predicates.front(), config.algorithm);
        shallow_diff = &computed;
    }

    const std::string subpath = element_path(path);
    SequenceDiffBuilder builder(a.size());

    // Cursors into a and b; unmentioned positions pair up in order
    std::size_t i = 0;
    std::size_t j = 0;
    auto take_aligned = [&](std::size_t n) {
        if (j + n > b.size()) {
            detail::raise_diff_error(diff_error::error_type::malformed_diff,
                                     "shallow diff at " + describe_path(path) +
                                     " pairs more elements than the target has");
        }
        for (std::size_t k = 0; k < n; ++k) {
            detail::diff_aligned_pair(builder, i + k, a[i + k].get(), b[j + k].get(),
                                      subpath, registry, config);
        }
        i += n;
        j += n;
    };

    for (const auto& entry : *shallow_diff) {
        const std::size_t key = entry.index();
        take_aligned(key > i ? key - i : 0);

        const auto [skip_a, skip_b] = count_consumed(entry);
        i += skip_a;
        j += skip_b;
        builder.append(entry);
    }
    take_aligned(a.size() - i);

    if (j != b.size()) {
        detail::raise_diff_error(diff_error::error_type::malformed_diff,
                                 "shallow diff at " + describe_path(path) + " consumes " +
                                 std::to_string(j) + " of " + std::to_string(b.size()) +
                                 " target elements");
    }
    return builder.validated();
}

Diff diff_dicts(const ValueMap& a, const ValueMap& b,
                const std::string& path,
                const PathRegistry& registry,
                const DiffConfig& config)
{
    MappingDiffBuilder builder;

    for (const std::string* key : sorted_keys(a)) {
        const auto* bbox = b.find(*key);
        if (!bbox) {
            builder.remove(*key);
            continue;
        }

        const Value& avalue = a.find(*key)->get();
        const Value& bvalue = bbox->get();
        const std::string subpath = join_path(path, *key);

        if (avalue.kind() == bvalue.kind() && !is_atomic(avalue)) {
            Diff sub = registry.differ_at(subpath)(avalue, bvalue, subpath, registry, config);
            if (!sub.empty()) {
                builder.patch(*key, std::move(sub));
            }
            continue;
        }

        if (registry.has_predicates(path) || registry.has_predicates(subpath)) {
            detail::raise_diff_error(diff_error::error_type::predicate_conflict,
                                     "predicates registered for " + describe_path(registry.has_predicates(path) ? path : subpath) +
                                     " but key '" + *key + "' holds " + std::string(kind_name(avalue.kind())) +
                                     " and " + std::string(kind_name(bvalue.kind())) + " values");
        }
        if (avalue != bvalue) {
            builder.replace(*key, bvalue);
        }
    }

    for (const std::string* key : sorted_keys(b)) {
        if (!a.find(*key)) {
            builder.add(*key, b.find(*key)->get());
        }
    }

    return builder.validated();
}

} // namespace docdiff
