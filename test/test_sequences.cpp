// test_sequences.cpp - Tests for shallow sequence alignment
// Module 4: Sequence aligner strategies

#include <catch2/catch_all.hpp>
#include <docdiff/errors.h>
#include <docdiff/sequences.h>
#include <docdiff/value.h>

#include "support/replay.h"

#include <random>
#include <string>
#include <vector>

using namespace docdiff;

namespace {

ValueVector seq(std::initializer_list<Value> values)
{
    return Value::vector(values).as_vector();
}

std::size_t matched(const SnakeList& snakes)
{
    std::size_t total = 0;
    for (const auto& s : snakes) {
        total += s.n;
    }
    return total;
}

bool strictly_increasing(const SnakeList& snakes)
{
    std::size_t i = 0;
    std::size_t j = 0;
    for (const auto& s : snakes) {
        if (s.n == 0 || s.i < i || s.j < j) {
            return false;
        }
        i = s.i + s.n;
        j = s.j + s.n;
    }
    return true;
}

const SequenceAlgorithm all_algorithms[] = {
    SequenceAlgorithm::Exhaustive,
    SequenceAlgorithm::ClassicLcs,
    SequenceAlgorithm::LibraryAssisted,
};

} // namespace

// ============================================================
// Snake Algorithms
// ============================================================

TEST_CASE("compute_snakes on index relations", "[sequences][snakes]") {
    const std::string a = "ABCABBA";
    const std::string b = "CBABAC";
    auto eq = [&](std::size_t i, std::size_t j) { return a[i] == b[j]; };

    SECTION("exhaustive and Myers are minimal") {
        // LCS("ABCABBA", "CBABAC") has length 4
        auto brute = compute_snakes_bruteforce(a.size(), b.size(), eq);
        auto myers = compute_snakes_myers(a.size(), b.size(), eq);
        REQUIRE(matched(brute) == 4);
        REQUIRE(matched(myers) == 4);
        REQUIRE(strictly_increasing(brute));
        REQUIRE(strictly_increasing(myers));
    }

    SECTION("matching blocks are a valid alignment") {
        auto blocks = compute_snakes_matching_blocks(a.size(), b.size(), eq);
        REQUIRE(strictly_increasing(blocks));
        REQUIRE(matched(blocks) >= 3);
        for (const auto& s : blocks) {
            for (std::size_t k = 0; k < s.n; ++k) {
                REQUIRE(a[s.i + k] == b[s.j + k]);
            }
        }
    }

    SECTION("empty inputs") {
        auto never = [](std::size_t, std::size_t) { return true; };
        REQUIRE(compute_snakes_bruteforce(0, 3, never).empty());
        REQUIRE(compute_snakes_myers(3, 0, never).empty());
        REQUIRE(compute_snakes_matching_blocks(0, 0, never).empty());
    }

    SECTION("identical inputs give one snake") {
        auto same = [&](std::size_t i, std::size_t j) { return a[i] == a[j]; };
        for (auto algorithm : all_algorithms) {
            auto snakes = compute_snakes(a.size(), a.size(), same, algorithm);
            REQUIRE(snakes == SnakeList{Snake{0, 0, a.size()}});
        }
    }
}

TEST_CASE("Exhaustive alignment tie-break", "[sequences][snakes]") {
    SECTION("a source element matches its earliest target") {
        // a = [x], b = [x, x]: x pairs with b[0]
        auto snakes = compute_snakes_bruteforce(1, 2, [](std::size_t, std::size_t) { return true; });
        REQUIRE(snakes == SnakeList{Snake{0, 0, 1}});
    }

    SECTION("targets are skipped before sources") {
        // a = [1, 2], b = [2, 1]: both alignments have length 1, keep a[0] = b[1]
        const int a[] = {1, 2};
        const int b[] = {2, 1};
        auto snakes = compute_snakes_bruteforce(2, 2, [&](std::size_t i, std::size_t j) { return a[i] == b[j]; });
        REQUIRE(snakes == SnakeList{Snake{0, 1, 1}});
    }
}

TEST_CASE("Myers agrees with the exhaustive length", "[sequences][snakes]") {
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"", "abc"},
        {"abc", ""},
        {"abc", "abc"},
        {"abcabba", "cbabac"},
        {"kitten", "sitting"},
        {"aaaa", "aa"},
        {"xyz", "zyx"},
        {"the quick brown fox", "the quack brown fix"},
    };
    for (const auto& [a, b] : cases) {
        auto eq = [&](std::size_t i, std::size_t j) { return a[i] == b[j]; };
        INFO(a << " -> " << b);
        auto myers = compute_snakes_myers(a.size(), b.size(), eq);
        REQUIRE(strictly_increasing(myers));
        REQUIRE(matched(myers) == matched(compute_snakes_bruteforce(a.size(), b.size(), eq)));
    }
}

TEST_CASE("Myers matches the exhaustive length on random inputs", "[sequences][snakes][random]") {
    const auto seed = GENERATE(range(1u, 201u));
    std::mt19937 rng{seed};
    auto pick = [&rng](int n) { return std::uniform_int_distribution<int>(0, n - 1)(rng); };

    const int alphabet = 1 + pick(3);
    std::vector<int> a(static_cast<std::size_t>(pick(11)));
    std::vector<int> b(static_cast<std::size_t>(pick(11)));
    for (auto& x : a) x = pick(alphabet);
    for (auto& y : b) y = pick(alphabet);
    auto eq = [&](std::size_t i, std::size_t j) { return a[i] == b[j]; };
    INFO("seed " << seed << ", sizes " << a.size() << " x " << b.size());

    auto brute = compute_snakes_bruteforce(a.size(), b.size(), eq);
    auto myers = compute_snakes_myers(a.size(), b.size(), eq);
    auto blocks = compute_snakes_matching_blocks(a.size(), b.size(), eq);

    REQUIRE(matched(myers) == matched(brute));
    REQUIRE(matched(blocks) <= matched(brute));
    for (const auto* snakes : {&brute, &myers, &blocks}) {
        REQUIRE(strictly_increasing(*snakes));
        for (const auto& s : *snakes) {
            REQUIRE(s.i + s.n <= a.size());
            REQUIRE(s.j + s.n <= b.size());
            for (std::size_t k = 0; k < s.n; ++k) {
                REQUIRE(eq(s.i + k, s.j + k));
            }
        }
    }
}

TEST_CASE("Myers on large inputs", "[sequences][snakes][large]") {
    SECTION("disjoint text is one add run and one remove run") {
        const std::size_t n = 6000;
        const std::string a(n, 'a');
        const std::string b(n, 'b');
        auto d = diff_strings(a, b, SequenceAlgorithm::ClassicLcs);
        REQUIRE(d.size() == 2);
        REQUIRE(d[0].op == DiffOp::Add);
        REQUIRE(d[0].index() == 0);
        REQUIRE(d[0].values.size() == n);
        REQUIRE(d[1] == DiffEntry::remove_range(0, n));
        REQUIRE(testing::replay(Value{a}, d) == Value{b});
    }

    SECTION("disjoint index ranges match nothing") {
        const std::size_t n = 5000;
        const std::size_t m = 4000;
        auto snakes = compute_snakes_myers(n, m, [](std::size_t, std::size_t) { return false; });
        REQUIRE(snakes.empty());
    }

    SECTION("a few edits in a long sequence") {
        const std::size_t n = 200000;
        std::vector<long> a(n);
        for (std::size_t i = 0; i < n; ++i) {
            a[i] = static_cast<long>(i);
        }
        std::vector<long> b = a;
        b.erase(b.begin() + 150000);
        b.insert(b.begin() + 90000, -1);
        b.erase(b.begin() + 100);

        auto eq = [&](std::size_t i, std::size_t j) { return a[i] == b[j]; };
        auto snakes = compute_snakes_myers(a.size(), b.size(), eq);
        REQUIRE(strictly_increasing(snakes));
        REQUIRE(matched(snakes) == n - 2);
        REQUIRE(snakes == SnakeList{Snake{0, 0, 100}, Snake{101, 100, 89899},
                                    Snake{90000, 90000, 60000}, Snake{150001, 150000, 49999}});
    }
}

// ============================================================
// diff_sequence
// ============================================================

TEST_CASE("diff_sequence edge cases", "[sequences][diff]") {
    auto algorithm = GENERATE(SequenceAlgorithm::Exhaustive,
                              SequenceAlgorithm::ClassicLcs,
                              SequenceAlgorithm::LibraryAssisted);
    INFO("algorithm: " << to_string(algorithm));

    SECTION("empty source gives one add run") {
        auto d = diff_sequence({}, seq({1, 2, 3}), Predicate::equality(), algorithm);
        REQUIRE(d.size() == 1);
        REQUIRE(d[0] == DiffEntry::add_range(0, seq({1, 2, 3})));
    }

    SECTION("empty target gives one remove run") {
        auto d = diff_sequence(seq({1, 2, 3}), {}, Predicate::equality(), algorithm);
        REQUIRE(d == Diff{DiffEntry::remove_range(0, 3)});
    }

    SECTION("equal sequences give an empty diff") {
        REQUIRE(diff_sequence(seq({1, 2, 3}), seq({1, 2, 3}), Predicate::equality(), algorithm).empty());
    }

    SECTION("single changed element is a replace") {
        auto d = diff_sequence(seq({1, 2, 3}), seq({1, 9, 3}), Predicate::equality(), algorithm);
        REQUIRE(d == Diff{DiffEntry::replace(std::size_t{1}, Value{9})});
    }

    SECTION("a gap with unequal sides becomes add then remove") {
        auto d = diff_sequence(seq({1, 2, 3, 4}), seq({1, 7, 8, 9, 4}), Predicate::equality(), algorithm);
        REQUIRE(d == Diff{DiffEntry::add_range(1, seq({7, 8, 9})), DiffEntry::remove_range(1, 2)});
    }
}

TEST_CASE("diff_sequence with a custom predicate", "[sequences][diff]") {
    auto same_parity = make_predicate("same parity", [](const Value& x, const Value& y) {
        return x.as_int() % 2 == y.as_int() % 2;
    });

    SECTION("pairs judged similar are not mentioned") {
        auto d = diff_sequence(seq({1, 2}), seq({3, 4}), same_parity);
        REQUIRE(d.empty());
    }

    SECTION("library-assisted needs equality") {
        REQUIRE_THROWS_AS(diff_sequence(seq({1}), seq({3}), same_parity, SequenceAlgorithm::LibraryAssisted),
                          diff_error);
        try {
            (void)diff_sequence(seq({1}), seq({3}), same_parity, SequenceAlgorithm::LibraryAssisted);
        } catch (const diff_error& e) {
            REQUIRE(e.type() == diff_error::error_type::unsupported_predicate);
        }
    }
}

TEST_CASE("diff_sequence reorder example", "[sequences][diff]") {
    auto a = seq({1, 2, 3});
    auto b = seq({1, 3, 2, 4});

    SECTION("classic LCS") {
        auto d = diff_sequence(a, b, Predicate::equality(), SequenceAlgorithm::ClassicLcs);
        REQUIRE(d == Diff{DiffEntry::remove_range(1, 1), DiffEntry::add_range(3, seq({2, 4}))});
    }

    SECTION("exhaustive") {
        auto d = diff_sequence(a, b, Predicate::equality(), SequenceAlgorithm::Exhaustive);
        REQUIRE(d == Diff{DiffEntry::add_range(1, seq({3})), DiffEntry::replace(std::size_t{2}, Value{4})});
    }

    SECTION("every strategy replays to the target") {
        for (auto algorithm : all_algorithms) {
            auto d = diff_sequence(a, b, Predicate::equality(), algorithm);
            REQUIRE(testing::replay(Value{a}, d) == Value{b});
        }
    }
}

// ============================================================
// diff_strings
// ============================================================

TEST_CASE("diff_strings", "[sequences][text]") {
    SECTION("kitten to sitting takes three entries") {
        for (auto algorithm : all_algorithms) {
            INFO("algorithm: " << to_string(algorithm));
            auto d = diff_strings("kitten", "sitting", algorithm);
            REQUIRE(d.size() == 3);
            REQUIRE(d[0] == DiffEntry::replace(std::size_t{0}, Value{"s"}));
            REQUIRE(d[1] == DiffEntry::replace(std::size_t{4}, Value{"i"}));
            REQUIRE(d[2] == DiffEntry::add_range(6, seq({"g"})));
            REQUIRE_NOTHROW(validate_diff(d, Value{"kitten"}));
        }
    }

    SECTION("identical text") {
        REQUIRE(diff_strings("same", "same").empty());
    }

    SECTION("replays to the target") {
        const std::string a = "the quick brown fox";
        const std::string b = "a quick brown cat jumps";
        auto d = diff_strings(a, b);
        REQUIRE(testing::replay(Value{a}, d) == Value{b});
    }
}

// ============================================================
// Strategy names
// ============================================================

TEST_CASE("sequence algorithm names", "[sequences][config]") {
    REQUIRE(parse_sequence_algorithm("exhaustive") == SequenceAlgorithm::Exhaustive);
    REQUIRE(parse_sequence_algorithm("bruteforce") == SequenceAlgorithm::Exhaustive);
    REQUIRE(parse_sequence_algorithm("classic-lcs") == SequenceAlgorithm::ClassicLcs);
    REQUIRE(parse_sequence_algorithm("myers") == SequenceAlgorithm::ClassicLcs);
    REQUIRE(parse_sequence_algorithm("library-assisted") == SequenceAlgorithm::LibraryAssisted);
    REQUIRE(parse_sequence_algorithm("difflib") == SequenceAlgorithm::LibraryAssisted);
    REQUIRE_THROWS_AS(parse_sequence_algorithm("fastest"), std::invalid_argument);

    for (auto algorithm : all_algorithms) {
        REQUIRE(parse_sequence_algorithm(to_string(algorithm)) == algorithm);
    }
    REQUIRE(DiffConfig{}.algorithm == SequenceAlgorithm::ClassicLcs);
}
