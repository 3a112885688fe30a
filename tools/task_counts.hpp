#pragma once

#include <cstddef>
#include <vector>

// 1, 2, 4, ... up to and including max_tasks, stopping before the doubling
// would overflow.
inline std::vector<std::size_t> doubling_task_counts(std::size_t max_tasks) {
    std::vector<std::size_t> counts;
    for (std::size_t tasks = 1; tasks <= max_tasks; tasks *= 2) {
        counts.push_back(tasks);
        if (tasks > max_tasks / 2) break;
    }
    return counts;
}
