#include <cmath>
#include <cstddef>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <omp.h>

#include "recipsum/recipsum.hpp"
#include "task_counts.hpp"

namespace {

double omp_reciprocal_sum(const std::vector<double>& data) {
    const long long n = static_cast<long long>(data.size());
    double sum = 0.0;

    #pragma omp parallel for reduction(+:sum)
    for (long long i = 0; i < n; ++i) {
        sum += 1.0 / data[i];
    }
    return sum;
}

double relative_error(double value, double expected) {
    return expected == 0.0 ? std::fabs(value) : std::fabs(value - expected) / std::fabs(expected);
}

int usage(const char* prog) {
    std::cerr << "usage: " << prog << " [elements] [max_tasks]\n";
    return 1;
}

}  // namespace

int main(int argc, char** argv) {
    std::size_t n = 10000000;
    std::size_t max_tasks = 8;

    try {
        if (argc > 1) n = std::stoul(argv[1]);
        if (argc > 2) max_tasks = std::stoul(argv[2]);
    } catch (const std::exception&) {
        return usage(argv[0]);
    }
    if (argc > 3 || max_tasks == 0) return usage(argv[0]);

    std::vector<double> data(n);
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> dist(1.0, 100.0);
    for (auto& x : data) x = dist(rng);

    try {
        tf::Executor& executor = recipsum::shared_executor();
        recipsum::Reducer reducer(executor);

        std::cout << std::setprecision(12);
        std::cout << "Elements: " << n << ", workers: " << executor.num_workers()
                  << ", threshold: " << reducer.threshold() << "\n";

        double t0 = omp_get_wtime();
        double baseline = reducer.sequential_sum(data);
        double t1 = omp_get_wtime();
        std::cout << "Sequential          Time: " << t1 - t0 << " s, Sum: " << baseline << "\n";

        t0 = omp_get_wtime();
        double omp_sum = omp_reciprocal_sum(data);
        t1 = omp_get_wtime();
        std::cout << "OpenMP reduction    Time: " << t1 - t0 << " s, Sum: " << omp_sum
                  << ", rel. error: " << relative_error(omp_sum, baseline) << "\n";

        for (std::size_t tasks : doubling_task_counts(max_tasks)) {
            t0 = omp_get_wtime();
            double sum = reducer.parallel_sum(data, tasks);
            t1 = omp_get_wtime();
            std::cout << "Tasks: " << std::setw(4) << tasks << "         Time: " << t1 - t0
                      << " s, Sum: " << sum
                      << ", rel. error: " << relative_error(sum, baseline) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
