#include "setpart_engine/types.hpp"
#include "setpart_engine/enumerator.hpp"
#include "setpart_engine/rgs_utils.hpp"
#include "setpart_engine/stirling_table.hpp"
#include <algorithm>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace setpart;

static void assert_eq(const std::string& a, const std::string& b, const char* msg) {
    if (a != b) {
        std::cerr << "Assertion failed: " << msg << " ('" << a << "' != '" << b << "')\n";
        std::abort();
    }
}
static void assert_eq_size(size_t a, size_t b, const char* msg) {
    if (a != b) {
        std::cerr << "Assertion failed: " << msg << " (" << a << " != " << b << ")\n";
        std::abort();
    }
}
static void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "Assertion failed: " << msg << "\n";
        std::abort();
    }
}
static void assert_eq_rgs(const Rgs& a, const Rgs& b, const char* msg) {
    assert_eq(format_rgs(a), format_rgs(b), msg);
}
static void expect_invalid(const std::function<void()>& fn, const char* msg) {
    try {
        fn();
    } catch (const InvalidRequest&) {
        return;
    }
    std::cerr << "Expected InvalidRequest: " << msg << "\n";
    std::abort();
}

// RGS growth invariant, block window, and the carried restriction vector.
static void verify_cursor(const Cursor& c) {
    assert_eq_size(c.rgs.size(), static_cast<size_t>(c.n), "rgs length is n");
    assert_true(is_valid_rgs(c.rgs), "rgs growth invariant");
    int blocks = block_count(c.rgs);
    assert_true(blocks >= c.bounds.minBlocks && blocks <= c.bounds.maxBlocks, "block count within mode window");
    if (c.mode == Mode::ExactK) assert_true(blocks == c.k, "exactly k blocks");
    int runningMax = 0;
    for (size_t i = 1; i < c.rgs.size(); ++i) {
        runningMax = std::max(runningMax, c.rgs[i - 1]);
        assert_true(c.prefixMax[i] == runningMax, "restriction vector tracks prefix max");
    }
}

// Walk from first() to exhaustion, checking every state along the way.
static std::vector<Rgs> walk_forward(int n, Mode mode, int k) {
    std::vector<Rgs> seen;
    Cursor c = first(n, mode, k);
    verify_cursor(c);
    assert_true(c.rank == 0, "first has rank 0");
    seen.push_back(c.rgs);
    while (auto r = next(c)) {
        verify_cursor(c);
        assert_eq_rgs(*r, c.rgs, "next returns the cursor's rgs");
        assert_true(std::lexicographical_compare(seen.back().begin(), seen.back().end(), r->begin(), r->end()),
                    "strictly increasing lexicographic order");
        assert_true(c.rank == static_cast<int>(seen.size()), "rank counts successful steps");
        seen.push_back(*r);
    }
    assert_true(c.exhausted, "exhausted after running off the end");
    assert_eq_rgs(c.rgs, seen.back(), "cursor stays on last after exhaustion");
    assert_true(!next(c).has_value(), "next at the end stays absent");
    return seen;
}

int main() {
    // 1) first/last shapes
    assert_eq_rgs(first(5, Mode::All).rgs, Rgs{0, 0, 0, 0, 0}, "first ALL is one block");
    assert_eq_rgs(last(5, Mode::All).rgs, Rgs{0, 1, 2, 3, 4}, "last ALL is singletons");
    assert_eq_rgs(first(5, Mode::ExactK, 3).rgs, Rgs{0, 0, 0, 1, 2}, "first EXACT_K opens blocks at the tail");
    assert_eq_rgs(last(5, Mode::ExactK, 3).rgs, Rgs{0, 1, 2, 2, 2}, "last EXACT_K");
    assert_eq_rgs(first(4, Mode::ExactK, 4).rgs, Rgs{0, 1, 2, 3}, "k == n has a single partition");
    assert_eq_rgs(first(4, Mode::ExactK, 1).rgs, Rgs{0, 0, 0, 0}, "k == 1 has a single partition");
    assert_true(last(5, Mode::ExactK, 3).rank == 24, "last rank is S(5,3) - 1");

    // 2) ALL mode: Bell(n) distinct partitions in lexicographic order
    const std::vector<int> bellNumbers = {1, 1, 2, 5, 15, 52, 203, 877, 4140, 21147};
    for (int n = 0; n < static_cast<int>(bellNumbers.size()); ++n) {
        auto seq = walk_forward(n, Mode::All, 0);
        assert_eq_size(seq.size(), static_cast<size_t>(bellNumbers[n]), "Bell(n) partitions");
        assert_true(count(n, Mode::All) == bellNumbers[n], "count ALL is Bell(n)");
        std::set<Rgs> distinct(seq.begin(), seq.end());
        assert_eq_size(distinct.size(), seq.size(), "no duplicates");
        assert_eq_rgs(seq.back(), last(n, Mode::All).rgs, "walk ends at last()");
    }

    // 3) EXACT_K mode: S(n,k) partitions, each with exactly k blocks, reversible
    for (int n = 1; n <= 8; ++n) {
        for (int k = 1; k <= n; ++k) {
            auto seq = walk_forward(n, Mode::ExactK, k);
            assert_true(count(n, Mode::ExactK, k) == static_cast<int>(seq.size()), "count EXACT_K matches walk");
            assert_true(stirling2(n, k) == static_cast<int>(seq.size()), "walk length is S(n,k)");

            Cursor c = last(n, Mode::ExactK, k);
            std::vector<Rgs> back{ c.rgs };
            while (auto r = previous(c)) {
                verify_cursor(c);
                back.push_back(*r);
            }
            assert_true(c.rank == 0, "previous walk ends at rank 0");
            std::reverse(back.begin(), back.end());
            assert_true(back == seq, "previous visits the reverse sequence");
        }
    }

    // 4) next then previous round-trips from every non-terminal state
    for (auto mode : {Mode::All, Mode::ExactK}) {
        Cursor c = first(6, mode, 3);
        do {
            Rgs before = c.rgs;
            BigCount rankBefore = c.rank;
            Cursor ahead = c;
            if (!next(ahead)) break;
            assert_true(previous(ahead).has_value(), "previous after next succeeds");
            assert_eq_rgs(ahead.rgs, before, "next then previous restores rgs");
            assert_true(ahead.rank == rankBefore, "next then previous restores rank");
        } while (next(c));
    }

    // 5) absence at both ends
    {
        Cursor c = first(4, Mode::ExactK, 2);
        Rgs start = c.rgs;
        assert_true(!previous(c).has_value(), "previous at first is absent");
        assert_eq_rgs(c.rgs, start, "failed previous leaves cursor alone");
        assert_true(!c.exhausted, "not exhausted at first");

        Cursor e = last(4, Mode::ExactK, 2);
        assert_true(!next(e).has_value(), "next at last is absent");
        assert_true(e.exhausted, "exhausted flag set");
        assert_true(previous(e).has_value(), "can step back from the end");
        assert_true(!e.exhausted, "stepping back clears exhaustion");
        assert_eq_rgs(e.rgs, Rgs{0, 1, 1, 0}, "second to last of n=4,k=2");
    }

    // 6) n = 0 and invalid requests
    {
        Cursor c = first(0, Mode::All);
        assert_true(c.rgs.empty(), "empty partition");
        assert_true(count(0, Mode::All) == 1, "one partition of the empty set");
        assert_true(!next(c).has_value(), "empty set has no successor");
        assert_true(!previous(c).has_value(), "empty set has no predecessor");
        assert_true(blocks_of(c.rgs).empty(), "empty partition has no blocks");

        Cursor z = first(0, Mode::ExactK, 0);
        assert_true(z.rgs.empty(), "n = 0, k = 0 is the empty partition");
        assert_true(count(0, Mode::ExactK, 0) == 1, "S(0,0) = 1");

        expect_invalid([] { first(3, Mode::ExactK, 0); }, "k = 0 with n > 0");
        expect_invalid([] { first(3, Mode::ExactK, 4); }, "k > n");
        expect_invalid([] { first(3, Mode::ExactK, -1); }, "negative k");
        expect_invalid([] { first(-1, Mode::All); }, "negative n");
        expect_invalid([] { last(2, Mode::ExactK, 3); }, "last validates too");
        expect_invalid([] { count(3, Mode::ExactK, 0); }, "count validates too");
        expect_invalid([] { count(0, Mode::ExactK, 1); }, "n = 0 only admits k = 0");
    }

    // 7) blocks and display helpers
    {
        Rgs a{0, 0, 1, 0, 2};
        Blocks bs = blocks_of(a);
        assert_eq_size(bs.size(), 3, "three blocks");
        assert_true(bs[0] == std::vector<int>({1, 2, 4}), "block 0");
        assert_true(bs[1] == std::vector<int>({3}), "block 1");
        assert_true(bs[2] == std::vector<int>({5}), "block 2");
        assert_eq(format_blocks(bs), "{1,2,4} {3} {5}", "format blocks");
        assert_eq(format_rgs(a), "0 0 1 0 2", "format rgs");
        assert_eq(format_blocks(Blocks()), "{}", "format empty partition");
        assert_true(!is_valid_rgs(Rgs{0, 2}), "skipping a label is invalid");
        assert_true(!is_valid_rgs(Rgs{1}), "must start at 0");
        expect_invalid([] { blocks_of(Rgs{0, 2, 1}); }, "blocks_of rejects non-RGS");
    }

    // 8) exact counts beyond 64 bits
    assert_eq(count(26, Mode::All).str(), "49631246523618756274", "Bell(26)");
    assert_eq(count(20, Mode::ExactK, 10).str(), "5917584964655", "S(20,10)");
    assert_true(bell(20) == BigCount("51724158235372"), "Bell(20)");

    // 9) Random walk: cursor always agrees with the precomputed sequence at its rank
    {
        const int n = 10, k = 4;
        auto seq = walk_forward(n, Mode::ExactK, k);
        assert_eq_size(seq.size(), 34105, "S(10,4)");
        std::mt19937 rng(20240607u);
        std::uniform_int_distribution<int> coin(0, 2);
        Cursor c = first(n, Mode::ExactK, k);
        for (int i = 0; i < 5000; ++i) {
            bool forward = coin(rng) != 0;
            size_t before = c.rank.convert_to<size_t>();
            auto r = forward ? next(c) : previous(c);
            size_t after = c.rank.convert_to<size_t>();
            if (r) {
                assert_eq_size(after, forward ? before + 1 : before - 1, "rank moves by one");
            } else {
                assert_eq_size(after, before, "rank unchanged at a boundary");
                assert_true(forward ? before + 1 == seq.size() : before == 0, "absent only at the ends");
            }
            verify_cursor(c);
            assert_eq_rgs(c.rgs, seq[after], "cursor matches enumeration at its rank");
        }
    }

    std::cout << "All enumerator tests passed.\n";
    return 0;
}
