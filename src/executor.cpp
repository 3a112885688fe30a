#include "recipsum/executor.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "recipsum/errors.hpp"

namespace recipsum {

namespace {

std::mutex pool_mutex;
unsigned configured_workers = 0;  // 0 until set_worker_count()
std::unique_ptr<tf::Executor> pool;

}  // namespace

unsigned default_worker_count() {
    unsigned n = std::thread::hardware_concurrency();
    return n ? n : 4;
}

void set_worker_count(unsigned workers) {
    if (workers == 0) {
        throw InvalidArgument("set_worker_count: need at least one worker");
    }
    std::lock_guard<std::mutex> lk(pool_mutex);
    if (pool) {
        throw std::logic_error("set_worker_count: shared executor already started with " +
                               std::to_string(pool->num_workers()) + " workers");
    }
    configured_workers = workers;
}

unsigned worker_count() {
    std::lock_guard<std::mutex> lk(pool_mutex);
    if (pool) return static_cast<unsigned>(pool->num_workers());
    return configured_workers ? configured_workers : default_worker_count();
}

tf::Executor& shared_executor() {
    std::lock_guard<std::mutex> lk(pool_mutex);
    if (!pool) {
        unsigned n = configured_workers ? configured_workers : default_worker_count();
        pool = std::make_unique<tf::Executor>(n);
    }
    return *pool;
}

}  // namespace recipsum
