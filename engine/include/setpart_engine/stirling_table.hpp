#pragma once

#include "setpart_engine/types.hpp"
#include <map>
#include <mutex>
#include <utility>

namespace setpart {

// Memo of S(n,k) keyed by (n,k). Only the cells a request depends on are
// filled, and they are never rewritten.
class StirlingTable {
public:
    // S(n,k); 0 when k < 0 or k > n. Requires n >= 0.
    BigCount stirling2(int n, int k);
    // sum of S(n,k) over k
    BigCount bell(int n);

private:
    void fill(int n, int first, int last);
    const BigCount& cell(int n, int k) const;

    std::mutex mutex_;
    std::map<std::pair<int, int>, BigCount> values_;
};

// Process-wide table shared by count() and the tests.
StirlingTable& shared_stirling_table();

BigCount stirling2(int n, int k);
BigCount bell(int n);

} // namespace setpart
