#pragma once

#include <cstddef>
#include <vector>

#include <taskflow/taskflow.hpp>

#include "recipsum/chunk.hpp"
#include "recipsum/errors.hpp"
#include "recipsum/executor.hpp"
#include "recipsum/sequential.hpp"
#include "recipsum/task.hpp"

namespace recipsum {

// Runs reciprocal sums on a Taskflow executor. The executor is borrowed.
class Reducer {
public:
    explicit Reducer(tf::Executor& executor, std::size_t threshold = kDefaultThreshold);

    std::size_t threshold() const { return threshold_; }

    double sequential_sum(const std::vector<double>& input) const;
    double sequential_sum(const double* data, std::size_t size) const;

    // Splits the input into num_tasks chunks per level and blocks until the
    // tree has been reduced. Throws InvalidArgument for num_tasks == 0.
    double parallel_sum(const std::vector<double>& input, std::size_t num_tasks) const;
    double parallel_sum(const double* data, std::size_t size, std::size_t num_tasks) const;

private:
    tf::Executor& executor_;
    std::size_t threshold_;
};

// The following run on shared_executor() with kDefaultThreshold.
double parallel_sum(const std::vector<double>& input, std::size_t num_tasks);
double parallel_sum(const double* data, std::size_t size, std::size_t num_tasks);

// Two halves reduced in parallel.
double parallel_sum_two_tasks(const std::vector<double>& input);

}  // namespace recipsum
