#pragma once

#include <cstddef>
#include <vector>

#include "recipsum/chunk.hpp"

namespace recipsum {

// Sum of 1/data[i] for i in range, accumulated in ascending index order.
// Throws InvalidRange if range is not inside [0, size).
double reciprocal_sum(const double* data, std::size_t size, IndexRange range);

// Whole-array baseline. Same order as reciprocal_sum over [0, size).
double sequential_sum(const double* data, std::size_t size);
double sequential_sum(const std::vector<double>& input);

}  // namespace recipsum
