#pragma once

#include <cstddef>
#include <vector>

#include <taskflow/taskflow.hpp>

#include "recipsum/chunk.hpp"

namespace recipsum {

// Ranges of at most this many elements are reduced sequentially.
constexpr std::size_t kDefaultThreshold = 500000;

// One node of the reduction tree. A node over more than `threshold`
// elements splits its own range into `fan_out` chunks, runs a child node
// per chunk inside its subflow, and adds the children's values in chunk
// order once all of them have joined. Smaller ranges are leaves.
//
// The node owns its children; the input is borrowed and must outlive
// compute().
class ReciprocalSumTask {
public:
    // Throws InvalidRange for a range outside [0, size) and InvalidArgument
    // for a zero fan_out or threshold, or null data with size > 0.
    ReciprocalSumTask(const double* data, std::size_t size, IndexRange range,
                      std::size_t fan_out, std::size_t threshold = kDefaultThreshold);

    bool is_leaf() const;

    // Runs this node, spawning children into `sf`. Returns after the whole
    // subtree has completed.
    void compute(tf::Subflow& sf);

    // Reduces the whole range on the calling thread without splitting.
    void compute_sequential();

    double value() const { return value_; }
    IndexRange range() const { return range_; }
    const std::vector<ReciprocalSumTask>& children() const { return children_; }

private:
    const double* data_;
    std::size_t size_;
    IndexRange range_;
    std::size_t fan_out_;
    std::size_t threshold_;
    std::vector<ReciprocalSumTask> children_;
    double value_ = 0.0;
};

}  // namespace recipsum
