/**
 * @file parallel-evaluation.cpp
 * @brief Evaluating one constraint over many values on TBB workers
 *
 * The caller's execution context is established on every worker, so the default
 * floating-point tolerance set here is honoured by the parallel evaluation.
 *
 * Compile with:
 *   g++ -std=c++23 -DASSERTLAB_HAVE_TBB -I../../include parallel-evaluation.cpp -ltbb -o parallel-evaluation
 *
 * Run with:
 *   ./parallel-evaluation
 */

#include <chrono>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <vector>

#include <assertlab/assertlab.hpp>
#include <assertlab/parallel/tbb_context.hpp>

using namespace assertlab;
using namespace assertlab::constraints;

int main() {
    std::cout << "assertlab Parallel Evaluation Example\n";
    std::cout << "=====================================\n\n";

    context::ExecutionContext ctx;
    ctx.set_default_floating_point_tolerance(core::Tolerance(1e-3));
    auto scope = ctx.establish_execution_environment();

    // Samples of sin^2 + cos^2, which should all be one
    std::vector<core::Value> samples;
    constexpr std::size_t count = 200000;
    samples.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        double x = static_cast<double>(i) * 0.001;
        samples.push_back(core::Value(std::sin(x) * std::sin(x) + std::cos(x) * std::cos(x)));
    }

    auto unit = Is::equal_to(1.0).resolve();
    parallel::ContextExecutor executor;

    auto start = std::chrono::high_resolution_clock::now();
    auto matches = executor.parallel_matches(unit, samples);
    auto end = std::chrono::high_resolution_clock::now();

    std::size_t accepted = 0;
    for (bool match : matches) {
        accepted += match ? 1 : 0;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    std::cout << "Evaluated " << samples.size() << " samples in " << elapsed.count() << " us\n";
    std::cout << "Accepted:  " << accepted << " (expected " << samples.size() << ")\n";

    return accepted == samples.size() ? 0 : 1;
}
