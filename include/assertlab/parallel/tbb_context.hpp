#pragma once

#ifdef ASSERTLAB_HAVE_TBB

#include <cstddef>
#include <span>
#include <vector>

#include <assertlab/constraints/constraint.hpp>
#include <assertlab/context/execution_context.hpp>
#include <assertlab/core/value.hpp>
#include <assertlab/utils/logger.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/partitioner.h>

namespace assertlab::parallel {

/// Applies one constraint to many values on TBB workers
///
/// The context current on the calling thread is captured when an evaluation starts and
/// established inside every chunk, so tolerance and formatter settings seen by the
/// workers are the caller's. static_partitioner keeps chunk boundaries identical from
/// run to run.
class ContextExecutor {
  public:
    ContextExecutor() = default;

    /// Evaluate `constraint` against every value
    ///
    /// Results keep the order of `actuals`. If evaluation throws for any value the
    /// exception propagates out of this call.
    [[nodiscard]] std::vector<constraints::ResultPtr>
    parallel_apply(const constraints::ConstraintPtr& constraint,
                   std::span<const core::Value> actuals) const {
        std::vector<constraints::ResultPtr> results(actuals.size());
        context::ExecutionContext* captured = &context::ExecutionContext::current();
        constraints::EvaluationContext evaluation = captured->evaluation_context();

        log().debug("Evaluating {} against {} values", constraint->display_name(), actuals.size());

        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, actuals.size()),
            [&](const tbb::blocked_range<std::size_t>& range) {
                auto scope = captured->establish_execution_environment();
                for (std::size_t i = range.begin(); i != range.end(); ++i) {
                    results[i] = constraint->apply_to(actuals[i], evaluation);
                }
            },
            tbb::static_partitioner{});

        return results;
    }

    /// Success flag per value, in input order
    [[nodiscard]] std::vector<bool> parallel_matches(const constraints::ConstraintPtr& constraint,
                                                     std::span<const core::Value> actuals) const {
        auto results = parallel_apply(constraint, actuals);
        std::vector<bool> matches;
        matches.reserve(results.size());
        for (const auto& result : results) {
            matches.push_back(result->is_success());
        }
        return matches;
    }

  private:
    static utils::Logger& log() {
        static utils::Logger logger("assertlab.parallel.ContextExecutor");
        return logger;
    }
};

} // namespace assertlab::parallel

#else
#error "ContextExecutor requires Intel TBB. Please install TBB or use a build that defines ASSERTLAB_HAVE_TBB."
#endif // ASSERTLAB_HAVE_TBB
