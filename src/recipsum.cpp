#include "recipsum/recipsum.hpp"

namespace recipsum {

Reducer::Reducer(tf::Executor& executor, std::size_t threshold)
    : executor_(executor), threshold_(threshold) {
    if (threshold == 0) {
        throw InvalidArgument("Reducer: threshold must be at least 1");
    }
}

double Reducer::sequential_sum(const std::vector<double>& input) const {
    return recipsum::sequential_sum(input);
}

double Reducer::sequential_sum(const double* data, std::size_t size) const {
    return recipsum::sequential_sum(data, size);
}

double Reducer::parallel_sum(const std::vector<double>& input, std::size_t num_tasks) const {
    return parallel_sum(input.data(), input.size(), num_tasks);
}

double Reducer::parallel_sum(const double* data, std::size_t size, std::size_t num_tasks) const {
    if (num_tasks == 0) {
        throw InvalidArgument("parallel_sum: num_tasks must be at least 1");
    }
    ReciprocalSumTask root(data, size, IndexRange{0, size}, num_tasks, threshold_);

    if (root.is_leaf()) {
        root.compute_sequential();
        return root.value();
    }

    tf::Taskflow taskflow("reciprocal_sum");
    taskflow.emplace([&root](tf::Subflow& sf) { root.compute(sf); }).name("root");
    executor_.run(taskflow).get();
    return root.value();
}

double parallel_sum(const std::vector<double>& input, std::size_t num_tasks) {
    return Reducer(shared_executor()).parallel_sum(input, num_tasks);
}

double parallel_sum(const double* data, std::size_t size, std::size_t num_tasks) {
    return Reducer(shared_executor()).parallel_sum(data, size, num_tasks);
}

double parallel_sum_two_tasks(const std::vector<double>& input) {
    return parallel_sum(input, 2);
}

}  // namespace recipsum
