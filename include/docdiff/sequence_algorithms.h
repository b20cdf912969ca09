// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sequence_algorithms.h
/// @brief Shallow alignment of two index ranges under a relation.
///
/// All routines work on indices only: `eq(i, j)` tells whether element i
/// of the source may be aligned with element j of the target. They return
/// the alignment as snakes, maximal diagonal runs of matched pairs, in
/// increasing order and never overlapping.
///
/// Strategies:
///   - compute_snakes_bruteforce:      full LCS table, minimal
///   - compute_snakes_myers:           middle-snake bisection, minimal
///   - compute_snakes_matching_blocks: recursive longest matching block,
///                                     valid only for equivalence relations

#pragma once

#include "concepts.h"
#include "diff_config.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace docdiff {

/// Run of matched pairs (i + k, j + k) for k < n
struct Snake {
    std::size_t i = 0;
    std::size_t j = 0;
    std::size_t n = 0;

    bool operator==(const Snake&) const = default;
};

using SnakeList = std::vector<Snake>;

namespace detail {

/// Append the pair (i, j), extending the last snake when it is adjacent
inline void push_match(SnakeList& snakes, std::size_t i, std::size_t j, std::size_t n = 1)
{
    if (n == 0) {
        return;
    }
    if (!snakes.empty()) {
        auto& last = snakes.back();
        if (last.i + last.n == i && last.j + last.n == j) {
            last.n += n;
            return;
        }
    }
    snakes.push_back(Snake{i, j, n});
}

} // namespace detail

// ============================================================
// Exhaustive LCS
// ============================================================

/// Minimal alignment from the full LCS table.
///
/// A pair is taken as soon as eq(i, j) holds. Otherwise the target cursor
/// advances while that does not shorten the common subsequence, so each
/// source element is matched at the earliest possible position.
template<IndexRelation Eq>
[[nodiscard]] SnakeList compute_snakes_bruteforce(std::size_t n, std::size_t m, Eq&& eq)
{
    SnakeList snakes;
    if (n == 0 || m == 0) {
        return snakes;
    }

    const std::size_t width = m + 1;
    std::vector<uint8_t> match(n * m);
    std::vector<std::size_t> lcs((n + 1) * width, 0);  // lcs[i][j]: LCS of a[i:], b[j:]

    for (std::size_t i = n; i-- > 0;) {
        for (std::size_t j = m; j-- > 0;) {
            const bool same = static_cast<bool>(eq(i, j));
            match[i * m + j] = same ? 1 : 0;
            lcs[i * width + j] = same
                ? lcs[(i + 1) * width + j + 1] + 1
                : std::max(lcs[(i + 1) * width + j], lcs[i * width + j + 1]);
        }
    }

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < n && j < m) {
        if (match[i * m + j]) {
            detail::push_match(snakes, i, j);
            ++i;
            ++j;
        } else if (lcs[i * width + j + 1] >= lcs[(i + 1) * width + j]) {
            ++j;
        } else {
            ++i;
        }
    }
    return snakes;
}

// ============================================================
// Myers O((n+m)D), linear space
// ============================================================

namespace detail {

/// Divide-and-conquer form of Myers' algorithm.
///
/// Each box is trimmed of its common prefix and suffix, then split at the
/// middle of one of its shortest edit scripts, found by running the greedy
/// search from both corners until the two frontiers meet. The halves are
/// aligned the same way. The forward and backward frontiers are indexed by
/// diagonal k = x - y and reused at every level, so memory is O(n + m).
template<typename Eq>
class MyersBisection {
public:
    using diag_t = std::ptrdiff_t;

    MyersBisection(std::size_t n, std::size_t m, Eq& eq, SnakeList& snakes)
        : eq_(eq)
        , snakes_(snakes)
        , offset_(static_cast<diag_t>(m) + 1)
        , forward_(n + m + 3)
        , backward_(n + m + 3)
    {
    }

    /// Align [xoff, xlim) x [yoff, ylim), appending matches in order
    void compare(diag_t xoff, diag_t xlim, diag_t yoff, diag_t ylim)
    {
        diag_t head = 0;
        while (xoff + head < xlim && yoff + head < ylim && match(xoff + head, yoff + head)) {
            ++head;
        }
        push(xoff, yoff, head);
        xoff += head;
        yoff += head;

        diag_t tail = 0;
        while (xlim - tail > xoff && ylim - tail > yoff && match(xlim - tail - 1, ylim - tail - 1)) {
            ++tail;
        }
        xlim -= tail;
        ylim -= tail;

        if (xoff < xlim && yoff < ylim) {
            const auto [xmid, ymid] = middle(xoff, xlim, yoff, ylim);
            compare(xoff, xmid, yoff, ymid);
            compare(xmid, xlim, ymid, ylim);
        }
        push(xlim, ylim, tail);
    }

private:
    [[nodiscard]] bool match(diag_t x, diag_t y)
    {
        return static_cast<bool>(eq_(static_cast<std::size_t>(x), static_cast<std::size_t>(y)));
    }

    void push(diag_t x, diag_t y, diag_t n)
    {
        push_match(snakes_, static_cast<std::size_t>(x), static_cast<std::size_t>(y),
                   static_cast<std::size_t>(n));
    }

    diag_t& fd(diag_t k) { return forward_[static_cast<std::size_t>(k + offset_)]; }
    diag_t& bd(diag_t k) { return backward_[static_cast<std::size_t>(k + offset_)]; }

    /// Midpoint of a shortest edit script of a box whose first and last
    /// elements do not match. Ties go to the deletion branch.
    std::pair<diag_t, diag_t> middle(diag_t xoff, diag_t xlim, diag_t yoff, diag_t ylim)
    {
        constexpr diag_t unreached = std::numeric_limits<diag_t>::max();
        const diag_t dmin = xoff - ylim;
        const diag_t dmax = xlim - yoff;
        const diag_t fmid = xoff - yoff;
        const diag_t bmid = xlim - ylim;
        const bool odd = ((fmid - bmid) & 1) != 0;
        diag_t fmin = fmid;
        diag_t fmax = fmid;
        diag_t bmin = bmid;
        diag_t bmax = bmid;

        fd(fmid) = xoff;
        bd(bmid) = xlim;

        while (true) {
            // Forward: one more edit on every diagonal
            if (fmin > dmin) {
                fd(--fmin - 1) = -1;
            } else {
                ++fmin;
            }
            if (fmax < dmax) {
                fd(++fmax + 1) = -1;
            } else {
                --fmax;
            }
            for (diag_t k = fmax; k >= fmin; k -= 2) {
                const diag_t lo = fd(k - 1);
                const diag_t hi = fd(k + 1);
                diag_t x = lo >= hi ? lo + 1 : hi;
                diag_t y = x - k;
                while (x < xlim && y < ylim && match(x, y)) {
                    ++x;
                    ++y;
                }
                fd(k) = x;
                if (odd && bmin <= k && k <= bmax && bd(k) <= x) {
                    return {x, y};
                }
            }

            // Backward from the bottom-right corner
            if (bmin > dmin) {
                bd(--bmin - 1) = unreached;
            } else {
                ++bmin;
            }
            if (bmax < dmax) {
                bd(++bmax + 1) = unreached;
            } else {
                --bmax;
            }
            for (diag_t k = bmax; k >= bmin; k -= 2) {
                const diag_t lo = bd(k - 1);
                const diag_t hi = bd(k + 1);
                diag_t x = lo < hi ? lo : hi - 1;
                diag_t y = x - k;
                while (x > xoff && y > yoff && match(x - 1, y - 1)) {
                    --x;
                    --y;
                }
                bd(k) = x;
                if (!odd && fmin <= k && k <= fmax && x <= fd(k)) {
                    return {x, y};
                }
            }
        }
    }

    Eq& eq_;
    SnakeList& snakes_;
    diag_t offset_;
    std::vector<diag_t> forward_;
    std::vector<diag_t> backward_;
};

} // namespace detail

/// Minimal alignment by Myers' O((n+m)D) algorithm in linear space.
template<IndexRelation Eq>
[[nodiscard]] SnakeList compute_snakes_myers(std::size_t n, std::size_t m, Eq&& eq)
{
    SnakeList snakes;
    if (n == 0 || m == 0) {
        return snakes;
    }

    detail::MyersBisection<std::remove_reference_t<Eq>> search(n, m, eq, snakes);
    search.compare(0, static_cast<std::ptrdiff_t>(n), 0, static_cast<std::ptrdiff_t>(m));
    return snakes;
}

// ============================================================
// Longest matching blocks (Ratcliff/Obershelp)
// ============================================================

/// Alignment by recursive longest-matching-block decomposition, as done by
/// Python's difflib.SequenceMatcher without junk heuristics.
///
/// The longest block of the current rectangle is matched, then the parts
/// on its left and right are handled the same way. Among blocks of equal
/// length the one starting earliest in the source (then the target) wins.
/// Not always minimal. `eq` must be an equivalence relation.
template<IndexRelation Eq>
[[nodiscard]] SnakeList compute_snakes_matching_blocks(std::size_t n, std::size_t m, Eq&& eq)
{
    SnakeList blocks;
    if (n == 0 || m == 0) {
        return blocks;
    }

    struct Rect {
        std::size_t alo, ahi, blo, bhi;
    };
    std::vector<Rect> pending{{0, n, 0, m}};
    std::vector<std::size_t> prev(m + 1);
    std::vector<std::size_t> cur(m + 1);

    while (!pending.empty()) {
        const Rect r = pending.back();
        pending.pop_back();

        // Longest common run ending at (i, j), row by row
        std::size_t best_i = r.alo;
        std::size_t best_j = r.blo;
        std::size_t best_n = 0;
        std::fill(prev.begin() + r.blo, prev.begin() + r.bhi + 1, 0);
        for (std::size_t i = r.alo; i < r.ahi; ++i) {
            cur[r.blo] = 0;
            for (std::size_t j = r.blo; j < r.bhi; ++j) {
                const std::size_t len = eq(i, j) ? prev[j] + 1 : 0;
                cur[j + 1] = len;
                if (len > best_n) {
                    best_i = i + 1 - len;
                    best_j = j + 1 - len;
                    best_n = len;
                }
            }
            std::swap(prev, cur);
        }

        if (best_n == 0) {
            continue;
        }
        blocks.push_back(Snake{best_i, best_j, best_n});
        if (r.alo < best_i && r.blo < best_j) {
            pending.push_back(Rect{r.alo, best_i, r.blo, best_j});
        }
        if (best_i + best_n < r.ahi && best_j + best_n < r.bhi) {
            pending.push_back(Rect{best_i + best_n, r.ahi, best_j + best_n, r.bhi});
        }
    }

    std::sort(blocks.begin(), blocks.end(),
              [](const Snake& l, const Snake& r) { return l.i < r.i; });

    SnakeList snakes;
    for (const auto& b : blocks) {
        detail::push_match(snakes, b.i, b.j, b.n);
    }
    return snakes;
}

// ============================================================
// Dispatch
// ============================================================

/// Alignment of [0, n) x [0, m) with the given strategy
template<IndexRelation Eq>
[[nodiscard]] SnakeList compute_snakes(std::size_t n, std::size_t m, Eq&& eq, SequenceAlgorithm algorithm)
{
    switch (algorithm) {
        case SequenceAlgorithm::Exhaustive:
            return compute_snakes_bruteforce(n, m, eq);
        case SequenceAlgorithm::LibraryAssisted:
            return compute_snakes_matching_blocks(n, m, eq);
        case SequenceAlgorithm::ClassicLcs:
            break;
    }
    return compute_snakes_myers(n, m, eq);
}

} // namespace docdiff
