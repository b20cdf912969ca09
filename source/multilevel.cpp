// multilevel.cpp - Strict-to-loose alignment and diff assembly

#include <docdiff/multilevel.h>
#include <docdiff/sequences.h>
#include <docdiff/string_path.h>
#include <docdiff/structural_diff.h>

#include <stdexcept>
#include <vector>

namespace docdiff {

namespace {

struct LevelAligner {
    std::vector<const Value*> a;
    std::vector<const Value*> b;
    const PredicateList& predicates;
    SequenceAlgorithm algorithm;
    SnakeList result;

    void align(std::size_t level, std::size_t i0, std::size_t i1, std::size_t j0, std::size_t j1)
    {
        const Predicate& predicate = predicates[level];
        const SnakeList snakes = compute_snakes(
            i1 - i0, j1 - j0,
            [&](std::size_t i, std::size_t j) { return predicate(*a[i0 + i], *b[j0 + j]); },
            algorithm);

        const bool last_level = level + 1 == predicates.size();
        std::size_t i = i0;
        std::size_t j = j0;
        for (const auto& s : snakes) {
            const std::size_t si = i0 + s.i;
            const std::size_t sj = j0 + s.j;
            if (!last_level && si > i && sj > j) {
                align(level + 1, i, si, j, sj);
            }
            detail::push_match(result, si, sj, s.n);
            i = si + s.n;
            j = sj + s.n;
        }
        if (!last_level && i1 > i && j1 > j) {
            align(level + 1, i, i1, j, j1);
        }
    }
};

} // anonymous namespace

SnakeList compute_snakes_multilevel(const ValueVector& a, const ValueVector& b,
                                    const PredicateList& predicates, SequenceAlgorithm algorithm)
{
    if (predicates.empty()) {
        throw std::invalid_argument("compute_snakes_multilevel: empty predicate list");
    }
    for (const auto& predicate : predicates) {
        detail::require_supported(predicate, algorithm);
    }

    LevelAligner aligner{{}, {}, predicates, algorithm, {}};
    aligner.a.reserve(a.size());
    aligner.b.reserve(b.size());
    for (const auto& box : a) {
        aligner.a.push_back(&box.get());
    }
    for (const auto& box : b) {
        aligner.b.push_back(&box.get());
    }
    if (!a.empty() && !b.empty()) {
        aligner.align(0, 0, a.size(), 0, b.size());
    }
    return std::move(aligner.result);
}

Diff diff_from_snakes(const ValueVector& a, const ValueVector& b,
                      const SnakeList& snakes,
                      const std::string& path,
                      const PathRegistry& registry,
                      const DiffConfig& config)
{
    detail::check_snakes(snakes, a.size(), b.size());

    const std::string subpath = element_path(path);
    const auto target_at = [&](std::size_t j) { return b[j].get(); };

    SequenceDiffBuilder builder(a.size());
    std::size_t i = 0;
    std::size_t j = 0;
    for (const auto& s : snakes) {
        detail::emit_gap(builder, i, s.i, j, s.j, target_at);
        for (std::size_t k = 0; k < s.n; ++k) {
            detail::diff_aligned_pair(builder, s.i + k, a[s.i + k].get(), b[s.j + k].get(),
                                      subpath, registry, config);
        }
        i = s.i + s.n;
        j = s.j + s.n;
    }
    detail::emit_gap(builder, i, a.size(), j, b.size(), target_at);
    return builder.validated();
}

Diff diff_multilevel(const ValueVector& a, const ValueVector& b,
                     const PredicateList& predicates,
                     const std::string& path,
                     const PathRegistry& registry,
                     const DiffConfig& config)
{
    const auto snakes = compute_snakes_multilevel(a, b, predicates, config.algorithm);
    return diff_from_snakes(a, b, snakes, path, registry, config);
}

Diff diff_sequence_multilevel(const ValueVector& a, const ValueVector& b,
                              const std::string& path,
                              const PathRegistry& registry,
                              const DiffConfig& config)
{
    return diff_multilevel(a, b, registry.predicates_at(path), path, registry, config);
}

} // namespace docdiff
