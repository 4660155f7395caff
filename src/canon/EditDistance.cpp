#include "canon/EditDistance.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace canon {

size_t edit_budget(size_t len_a, size_t len_b, double ratio) {
    const double longest = (double)std::max(len_a, len_b);
    // nudge down so 0.3 * 10 stays 3 instead of rounding up to 4
    return (size_t)std::ceil(ratio * longest - 1e-9);
}

size_t bounded_levenshtein(const std::string& a, const std::string& b, size_t max_distance) {
    const size_t n = a.size();
    const size_t m = b.size();
    const size_t over = max_distance + 1;

    // length difference alone is a lower bound
    if ((n > m ? n - m : m - n) > max_distance) return over;
    if (n == 0) return m;
    if (m == 0) return n;

    std::vector<size_t> prev(m + 1), cur(m + 1);
    for (size_t j = 0; j <= m; ++j) prev[j] = j;

    for (size_t i = 1; i <= n; ++i) {
        cur[0] = i;
        size_t row_min = cur[0];

        for (size_t j = 1; j <= m; ++j) {
            const size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j - 1] + cost, prev[j] + 1, cur[j - 1] + 1});
            row_min = std::min(row_min, cur[j]);
        }

        // every later row is >= this row's minimum
        if (row_min > max_distance) return over;
        std::swap(prev, cur);
    }

    return std::min(prev[m], over);
}

}  // namespace canon
