#include "recipsum/sequential.hpp"

#include "recipsum/errors.hpp"

namespace recipsum {

double reciprocal_sum(const double* data, std::size_t size, IndexRange range) {
    if (range.begin > range.end || range.end > size) {
        throw InvalidRange(range.begin, range.end, size);
    }
    if (data == nullptr && size > 0) {
        throw InvalidArgument("reciprocal_sum: null input");
    }

    double sum = 0.0;
    for (std::size_t i = range.begin; i < range.end; ++i) {
        sum += 1.0 / data[i];
    }
    return sum;
}

double sequential_sum(const double* data, std::size_t size) {
    return reciprocal_sum(data, size, IndexRange{0, size});
}

double sequential_sum(const std::vector<double>& input) {
    return sequential_sum(input.data(), input.size());
}

}  // namespace recipsum
