#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "recipsum/recipsum.hpp"

using namespace recipsum;

TEST(ExecutorTest, DefaultWorkerCountIsPositive) {
    EXPECT_GE(default_worker_count(), 1u);
}

TEST(ExecutorTest, RejectsZeroWorkers) {
    EXPECT_THROW(set_worker_count(0), InvalidArgument);
}

// The shared executor can only start once per process, so the whole
// lifecycle is checked in one test.
TEST(ExecutorTest, WorkerCountFixedAtFirstUse) {
    set_worker_count(5);
    set_worker_count(3);
    EXPECT_EQ(worker_count(), 3u);

    tf::Executor& executor = shared_executor();
    EXPECT_EQ(executor.num_workers(), 3u);
    EXPECT_EQ(&shared_executor(), &executor);

    EXPECT_THROW(set_worker_count(2), std::logic_error);
    EXPECT_EQ(worker_count(), 3u);

    std::vector<double> a{1, 2, 4, 5};
    EXPECT_DOUBLE_EQ(parallel_sum(a, 2), 1.95);
}
