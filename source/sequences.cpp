// sequences.cpp - Shallow sequence and text diffs

#include <docdiff/sequences.h>
#include <docdiff/errors.h>

#include <string>
#include <vector>

namespace docdiff {

namespace {

std::vector<const Value*> gather(const ValueVector& vec)
{
    std::vector<const Value*> out;
    out.reserve(vec.size());
    for (const auto& box : vec) {
        out.push_back(&box.get());
    }
    return out;
}

Diff shallow_diff_from_snakes(std::size_t n, std::size_t m, const SnakeList& snakes,
                              const std::function<Value(std::size_t)>& target_at)
{
    SequenceDiffBuilder builder(n);
    std::size_t i = 0;
    std::size_t j = 0;
    for (const auto& s : snakes) {
        detail::emit_gap(builder, i, s.i, j, s.j, target_at);
        i = s.i + s.n;
        j = s.j + s.n;
    }
    detail::emit_gap(builder, i, n, j, m, target_at);
    return builder.validated();
}

} // anonymous namespace

namespace detail {

void require_supported(const Predicate& predicate, SequenceAlgorithm algorithm)
{
    if (algorithm == SequenceAlgorithm::LibraryAssisted && !predicate.is_equality()) {
        raise_diff_error(diff_error::error_type::unsupported_predicate,
                         "library-assisted alignment requires the equality predicate, got '" +
                         predicate.name() + "'");
    }
}

void emit_gap(SequenceDiffBuilder& builder,
              std::size_t i0, std::size_t i1, std::size_t j0, std::size_t j1,
              const std::function<Value(std::size_t)>& target_at)
{
    const std::size_t removed = i1 - i0;
    const std::size_t added = j1 - j0;

    if (removed == 1 && added == 1) {
        builder.replace(i0, target_at(j0));
        return;
    }
    if (added > 0) {
        auto run = ValueVector{}.transient();
        for (std::size_t j = j0; j < j1; ++j) {
            run.push_back(ValueBox{target_at(j)});
        }
        builder.add_range(i0, run.persistent());
    }
    if (removed > 0) {
        builder.remove(i0, removed);
    }
}

void check_snakes(const SnakeList& snakes, std::size_t n, std::size_t m)
{
    std::size_t i = 0;
    std::size_t j = 0;
    for (const auto& s : snakes) {
        if (s.n == 0 || s.i < i || s.j < j || s.i + s.n > n || s.j + s.n > m) {
            raise_diff_error(diff_error::error_type::malformed_diff,
                             "alignment run (" + std::to_string(s.i) + ", " + std::to_string(s.j) +
                             ", " + std::to_string(s.n) + ") is empty, out of order or out of bounds");
        }
        i = s.i + s.n;
        j = s.j + s.n;
    }
}

} // namespace detail

SnakeList compute_snakes(const ValueVector& a, const ValueVector& b,
                         const Predicate& predicate, SequenceAlgorithm algorithm)
{
    detail::require_supported(predicate, algorithm);
    const auto pa = gather(a);
    const auto pb = gather(b);
    return compute_snakes(pa.size(), pb.size(),
                          [&](std::size_t i, std::size_t j) { return predicate(*pa[i], *pb[j]); },
                          algorithm);
}

Diff diff_sequence(const ValueVector& a, const ValueVector& b,
                   const Predicate& predicate, SequenceAlgorithm algorithm)
{
    const auto snakes = compute_snakes(a, b, predicate, algorithm);
    return shallow_diff_from_snakes(a.size(), b.size(), snakes,
                                    [&](std::size_t j) { return b[j].get(); });
}

Diff diff_strings(std::string_view a, std::string_view b, SequenceAlgorithm algorithm)
{
    const auto snakes = compute_snakes(a.size(), b.size(),
                                       [&](std::size_t i, std::size_t j) { return a[i] == b[j]; },
                                       algorithm);
    return shallow_diff_from_snakes(a.size(), b.size(), snakes,
                                    [&](std::size_t j) { return Value{std::string(1, b[j])}; });
}

} // namespace docdiff
