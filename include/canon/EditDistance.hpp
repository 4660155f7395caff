#pragma once
#include <string>

namespace canon {

// Levenshtein distance between a and b, or max_distance + 1 as soon as the
// distance is known to exceed max_distance.
size_t bounded_levenshtein(const std::string& a, const std::string& b, size_t max_distance);

// ceil(ratio * max(len_a, len_b))
size_t edit_budget(size_t len_a, size_t len_b, double ratio);

}  // namespace canon
