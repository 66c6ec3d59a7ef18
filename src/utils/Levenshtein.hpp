#pragma once
#include <string>
#include <vector>
#include <algorithm>

namespace gcl::utils {

// Edit distance (insert, delete, substitute), two rolling rows.
inline int levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();
    if (m == 0) return static_cast<int>(n);
    if (n == 0) return static_cast<int>(m);

    std::vector<int> prev(n + 1), curr(n + 1);
    for (size_t j = 0; j <= n; ++j) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; ++i) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= n; ++j) {
            int cost = (s1[i - 1] == s2[j - 1]) ? 0 : 1;
            curr[j] = std::min({ prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost });
        }
        std::swap(prev, curr);
    }
    return prev[n];
}

// Closest candidate within `threshold` edits, or "" when none qualifies.
inline std::string closest_match(const std::string& word,
                                 const std::vector<std::string>& candidates,
                                 int threshold) {
    std::string best;
    int bestDist = threshold + 1;
    for (const auto& c : candidates) {
        if (c == word) continue;
        int d = levenshtein_distance(word, c);
        if (d < bestDist) {
            bestDist = d;
            best = c;
        }
    }
    return best;
}

}
