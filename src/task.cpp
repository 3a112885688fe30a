#include "recipsum/task.hpp"

#include <algorithm>
#include <string>

#include "recipsum/errors.hpp"
#include "recipsum/sequential.hpp"

namespace recipsum {

ReciprocalSumTask::ReciprocalSumTask(const double* data, std::size_t size, IndexRange range,
                                     std::size_t fan_out, std::size_t threshold)
    : data_(data), size_(size), range_(range), fan_out_(fan_out), threshold_(threshold) {
    if (range.begin > range.end || range.end > size) {
        throw InvalidRange(range.begin, range.end, size);
    }
    if (data == nullptr && size > 0) {
        throw InvalidArgument("ReciprocalSumTask: null input");
    }
    if (fan_out == 0) {
        throw InvalidArgument("ReciprocalSumTask: fan_out must be at least 1");
    }
    if (threshold == 0) {
        throw InvalidArgument("ReciprocalSumTask: threshold must be at least 1");
    }
}

// A fan-out of one would hand the whole range to a single child, which
// would split the same way forever.
bool ReciprocalSumTask::is_leaf() const {
    return range_.size() <= threshold_ || fan_out_ == 1;
}

void ReciprocalSumTask::compute_sequential() {
    value_ = reciprocal_sum(data_, size_, range_);
}

void ReciprocalSumTask::compute(tf::Subflow& sf) {
    if (is_leaf()) {
        compute_sequential();
        return;
    }

    // Every child must exist before any is spawned: the subflow tasks hold
    // references into children_. Only trailing chunks can be empty, and
    // those are not built.
    children_.clear();
    children_.reserve(std::min(fan_out_, range_.size()));
    for (std::size_t i = 0; i < fan_out_; ++i) {
        IndexRange chunk = chunk_range(i, fan_out_, range_);
        if (chunk.begin == range_.end) break;
        children_.emplace_back(data_, size_, chunk, fan_out_, threshold_);
    }

    for (std::size_t i = 0; i < children_.size(); ++i) {
        ReciprocalSumTask& child = children_[i];
        sf.emplace([&child](tf::Subflow& child_sf) { child.compute(child_sf); })
            .name("chunk_" + std::to_string(i));
    }
    sf.join();

    double sum = 0.0;
    for (const ReciprocalSumTask& child : children_) {
        sum += child.value_;
    }
    value_ = sum;
}

}  // namespace recipsum
