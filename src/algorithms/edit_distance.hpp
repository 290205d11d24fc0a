#pragma once

// Levenshtein distance over bytes: unit cost insert, delete and substitute.
// O(N*M) time, O(min(N, M)) space.

#include <cstdint>
#include <optional>
#include <string_view>

namespace mender {

// When `bound` is given the computation stops as soon as the result is
// known to exceed it, and returns bound + 1. Any return value <= bound is
// exact.
int64_t
edit_distance(std::string_view a, std::string_view b, std::optional<int64_t> bound = std::nullopt);

// (max_len - distance) / max_len, 1.0 for two empty strings.
double
similarity(std::string_view a, std::string_view b);

double
similarity_from_distance(int64_t distance, int64_t max_len);

// Largest distance that can still reach `threshold` for strings whose
// longest length is max_len. Never underestimates.
int64_t
max_distance_for(double threshold, int64_t max_len);

}  // namespace mender
