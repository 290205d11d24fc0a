#include "edit_distance.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

int64_t
mender::edit_distance(std::string_view a, std::string_view b, std::optional<int64_t> bound) {
    // Keep the row over the shorter string.
    if (a.size() < b.size()) {
        std::swap(a, b);
    }

    const auto N = static_cast<int64_t>(a.size());
    const auto M = static_cast<int64_t>(b.size());

    if (bound && N - M > *bound) {
        return *bound + 1;
    }
    if (M == 0) {
        return N;
    }

    std::vector<int64_t> row(static_cast<std::size_t>(M + 1));
    for (int64_t j = 0; j <= M; j++) {
        row[j] = j;
    }

    for (int64_t i = 1; i <= N; i++) {
        int64_t diagonal = row[0];
        row[0] = i;
        int64_t row_min = row[0];
        for (int64_t j = 1; j <= M; j++) {
            int64_t above = row[j];
            int64_t substitution = diagonal + (a[i - 1] == b[j - 1] ? 0 : 1);
            row[j] = std::min({row[j - 1] + 1, above + 1, substitution});
            diagonal = above;
            row_min = std::min(row_min, row[j]);
        }

        // Row minima never decrease; once above the bound we're done.
        if (bound && row_min > *bound) {
            return *bound + 1;
        }
    }

    return row[M];
}

double
mender::similarity_from_distance(int64_t distance, int64_t max_len) {
    if (max_len == 0) {
        return 1.0;
    }
    return static_cast<double>(max_len - distance) / static_cast<double>(max_len);
}

double
mender::similarity(std::string_view a, std::string_view b) {
    auto max_len = static_cast<int64_t>(std::max(a.size(), b.size()));
    return similarity_from_distance(edit_distance(a, b), max_len);
}

int64_t
mender::max_distance_for(double threshold, int64_t max_len) {
    // One extra unit of slack against rounding; the caller still compares
    // the exact similarity against the threshold.
    return static_cast<int64_t>(std::ceil(static_cast<double>(max_len) * (1.0 - threshold))) + 1;
}
