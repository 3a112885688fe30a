#pragma once

#include <taskflow/taskflow.hpp>

namespace recipsum {

// std::thread::hardware_concurrency(), or 4 when the host does not report it.
unsigned default_worker_count();

// Fixes the worker count of the shared executor. Allowed until the first
// call to shared_executor(); throws std::logic_error afterwards and
// InvalidArgument for zero.
void set_worker_count(unsigned workers);

unsigned worker_count();

// Process-wide executor, created on first use with worker_count() workers.
tf::Executor& shared_executor();

}  // namespace recipsum
