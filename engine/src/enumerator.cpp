#include "setpart_engine/enumerator.hpp"
#include "setpart_engine/rgs_utils.hpp"
#include "setpart_engine/stirling_table.hpp"
#include <algorithm>
#include <string>

// Lexicographic RGS stepping after Stamatelatos & Efraimidis, "Lexicographic
// Enumeration of Set Partitions" (algorithms V and X), generalized to a
// [minBlocks, maxBlocks] window so each mode is just a pair of bounds.

namespace setpart {

static std::string request_text(int n, int k) {
    return "(n=" + std::to_string(n) + ", k=" + std::to_string(k) + ")";
}

static void validate_request(int n, Mode mode, int k) {
    if (n < 0) throw InvalidRequest("set size must be non-negative " + request_text(n, k));
    if (mode != Mode::ExactK) return;
    if (k < 0 || k > n) throw InvalidRequest("block count must lie in 0..n " + request_text(n, k));
    if (k == 0 && n > 0) throw InvalidRequest("a nonempty set has no partition into 0 blocks " + request_text(n, k));
}

ModeBounds mode_bounds(int n, Mode mode, int k) {
    validate_request(n, mode, k);
    switch (mode) {
        case Mode::All:
            return ModeBounds{ n > 0 ? 1 : 0, n };
        case Mode::ExactK:
            return ModeBounds{ k, k };
    }
    throw InvalidRequest("unknown enumeration mode");
}

// Smallest completion of positions from..n-1: zeros, then just enough new
// labels at the tail to reach minBlocks. Keeps b in step with a.
static void fill_min_suffix(Rgs& a, std::vector<int>& b, int from, int minBlocks) {
    const int n = static_cast<int>(a.size());
    for (int j = from; j < n; ++j) {
        b[j] = std::max(a[j - 1], b[j - 1]);
        int missing = minBlocks - (b[j] + 1);
        a[j] = missing >= n - j ? b[j] + 1 : 0;
    }
}

// Largest completion: open a new block at every position until maxBlocks is hit.
static void fill_max_suffix(Rgs& a, std::vector<int>& b, int from, int maxBlocks) {
    const int n = static_cast<int>(a.size());
    for (int j = from; j < n; ++j) {
        b[j] = std::max(a[j - 1], b[j - 1]);
        a[j] = std::min(b[j] + 1, maxBlocks - 1);
    }
}

static Cursor make_cursor(int n, Mode mode, int k) {
    Cursor c;
    c.bounds = mode_bounds(n, mode, k);
    c.n = n;
    c.mode = mode;
    c.k = mode == Mode::ExactK ? k : 0;
    c.rgs.assign(static_cast<size_t>(n), 0);
    c.prefixMax.assign(static_cast<size_t>(n), 0);
    return c;
}

Cursor first(int n, Mode mode, int k) {
    Cursor c = make_cursor(n, mode, k);
    fill_min_suffix(c.rgs, c.prefixMax, 1, c.bounds.minBlocks);
    c.rank = 0;
    return c;
}

Cursor last(int n, Mode mode, int k) {
    Cursor c = make_cursor(n, mode, k);
    fill_max_suffix(c.rgs, c.prefixMax, 1, c.bounds.maxBlocks);
    c.rank = count(n, mode, k) - 1;
    return c;
}

std::optional<Rgs> next(Cursor& c) {
    auto& a = c.rgs;
    auto& b = c.prefixMax;
    const int n = static_cast<int>(a.size());
    for (int i = n - 1; i >= 1; --i) {
        // a[i] > b[i] means position i opened a new block and cannot grow further.
        if (a[i] > b[i] || a[i] + 1 >= c.bounds.maxBlocks) continue;
        ++a[i];
        fill_min_suffix(a, b, i + 1, c.bounds.minBlocks);
        ++c.rank;
        return a;
    }
    c.exhausted = true;
    return std::nullopt;
}

std::optional<Rgs> previous(Cursor& c) {
    auto& a = c.rgs;
    auto& b = c.prefixMax;
    const int n = static_cast<int>(a.size());
    for (int i = n - 1; i >= 1; --i) {
        if (a[i] == 0) continue;
        // blocks still reachable if a[i] drops by one and every later position opens a block
        int reachable = std::max(b[i], a[i] - 1) + 1 + (n - 1 - i);
        if (reachable < c.bounds.minBlocks) continue;
        --a[i];
        fill_max_suffix(a, b, i + 1, c.bounds.maxBlocks);
        --c.rank;
        c.exhausted = false;
        return a;
    }
    return std::nullopt;
}

BigCount count(int n, Mode mode, int k) {
    validate_request(n, mode, k);
    if (mode == Mode::ExactK) return stirling2(n, k);
    return bell(n);
}

Blocks blocks_of(const Rgs& rgs) {
    if (!is_valid_rgs(rgs)) throw InvalidRequest("not a restricted growth string: " + format_rgs(rgs));
    Blocks blocks;
    for (size_t i = 0; i < rgs.size(); ++i) {
        size_t label = static_cast<size_t>(rgs[i]);
        if (label >= blocks.size()) blocks.resize(label + 1);
        blocks[label].push_back(static_cast<int>(i) + 1);
    }
    return blocks;
}

} // namespace setpart
