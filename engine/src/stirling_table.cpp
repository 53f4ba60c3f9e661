#include "setpart_engine/stirling_table.hpp"
#include <algorithm>

namespace setpart {

/*
 * S(0,0) = 1, S(i,0) = 0 for i > 0, S(i,i) = 1
 * S(i,j) = j S(i-1,j) + S(i-1,j-1)
 * Base cells are never stored.
 */
const BigCount& StirlingTable::cell(int n, int k) const {
    static const BigCount one(1);
    static const BigCount zero(0);
    if (k == n) return one;
    if (k == 0) return zero;
    return values_.at(std::make_pair(n, k));
}

// Row i only needs columns [first - (n - i), last], which is exactly what
// row i + 1 reads for the same window one row further down.
void StirlingTable::fill(int n, int first, int last) {
    for (int i = 2; i <= n; ++i) {
        const int lo = std::max(1, first - (n - i));
        const int hi = std::min(i - 1, last);
        for (int j = lo; j <= hi; ++j) {
            const auto key = std::make_pair(i, j);
            auto it = values_.lower_bound(key);
            if (it != values_.end() && it->first == key) continue;
            values_.emplace_hint(it, key, BigCount(j * cell(i - 1, j) + cell(i - 1, j - 1)));
        }
    }
}

BigCount StirlingTable::stirling2(int n, int k) {
    if (n < 0 || k < 0 || k > n) return 0;
    if (k == n || k == 0) return cell(n, k);
    std::lock_guard<std::mutex> lock(mutex_);
    fill(n, k, k);
    return cell(n, k);
}

BigCount StirlingTable::bell(int n) {
    if (n < 0) return 0;
    std::lock_guard<std::mutex> lock(mutex_);
    fill(n, 0, n);
    BigCount sum = 0;
    for (int k = 0; k <= n; ++k) sum += cell(n, k);
    return sum;
}

StirlingTable& shared_stirling_table() {
    static StirlingTable table;
    return table;
}

BigCount stirling2(int n, int k) { return shared_stirling_table().stirling2(n, k); }

BigCount bell(int n) { return shared_stirling_table().bell(n); }

} // namespace setpart
