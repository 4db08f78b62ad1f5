#pragma once

/// @file execution_context.hpp
/// @brief Flow-local execution state: counters, formatter chain, tolerance, result, listener
///
/// Exactly one context is current per thread. A context captured on one thread can be
/// made current on another with establish_execution_environment(), which is how work
/// resumed on a different worker keeps seeing its own test state. Isolated scopes push a
/// child context and always restore the prior one when they end.

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <assertlab/constraints/constraint.hpp>
#include <assertlab/context/test_result.hpp>
#include <assertlab/core/tolerance.hpp>
#include <assertlab/core/value.hpp>
#include <assertlab/core/value_format.hpp>
#include <assertlab/utils/logger.hpp>

namespace assertlab::context {

class ContextScope;

class ExecutionContext : public std::enable_shared_from_this<ExecutionContext> {
  public:
    /// Root context: fresh result, null listener, default formatter
    ExecutionContext()
        : formatter_(core::make_default_formatter()),
          default_tolerance_(core::Tolerance::default_tolerance()),
          result_(std::make_shared<TestResult>()), listener_(std::make_shared<NullListener>()) {}

    /// Child of `prior`; settings are copied, the result and listener are shared and the
    /// assertion counter starts from zero
    explicit ExecutionContext(const ExecutionContext& prior)
        : std::enable_shared_from_this<ExecutionContext>(), prior_(&prior),
          multiple_assert_level_(prior.multiple_assert_level()),
          formatter_(prior.formatter_), default_tolerance_(prior.default_tolerance_),
          result_(prior.result_), listener_(prior.listener_), test_(prior.test_),
          start_time_(prior.start_time_) {}

    ExecutionContext& operator=(const ExecutionContext&) = delete;

    /// Context current on the calling thread; an ad-hoc one is created on first use
    static ExecutionContext& current() {
        ExecutionContext*& slot = current_slot();
        if (slot == nullptr) {
            thread_local std::shared_ptr<ExecutionContext> ad_hoc;
            if (!ad_hoc) {
                ad_hoc = std::make_shared<ExecutionContext>();
                log().debug("Created ad-hoc execution context");
            }
            slot = ad_hoc.get();
        }
        return *slot;
    }

    static bool has_current() { return current_slot() != nullptr; }

    /// Back link for restoration only; never owning
    const ExecutionContext* prior_context() const { return prior_; }

    /// Make this context current on the calling thread until the scope ends
    [[nodiscard]] ContextScope establish_execution_environment();

    void increment_assert_count() { assert_count_.fetch_add(1, std::memory_order_relaxed); }
    int assert_count() const { return assert_count_.load(std::memory_order_relaxed); }

    int multiple_assert_level() const {
        return multiple_assert_level_.load(std::memory_order_acquire);
    }

    int enter_multiple() { return multiple_assert_level_.fetch_add(1, std::memory_order_acq_rel) + 1; }
    int exit_multiple() { return multiple_assert_level_.fetch_sub(1, std::memory_order_acq_rel) - 1; }

    /// Wrap the current formatter; the factory receives the formatter it replaces
    void add_formatter(const core::ValueFormatterFactory& factory) {
        formatter_ = factory(formatter_);
    }

    const core::ValueFormatter& current_value_formatter() const { return formatter_; }

    std::string format(const core::Value& value) const { return formatter_(value); }

    const core::Tolerance& default_floating_point_tolerance() const { return default_tolerance_; }

    void set_default_floating_point_tolerance(core::Tolerance tolerance) {
        default_tolerance_ = std::move(tolerance);
    }

    constraints::EvaluationContext evaluation_context() const {
        return constraints::EvaluationContext{.default_floating_point_tolerance = default_tolerance_};
    }

    TestResult& current_result() { return *result_; }
    const TestResult& current_result() const { return *result_; }
    std::shared_ptr<TestResult> shared_result() const { return result_; }

    TestListener& listener() { return *listener_; }

    void set_listener(std::shared_ptr<TestListener> listener) {
        listener_ = listener ? std::move(listener) : std::make_shared<NullListener>();
    }

    /// Begin a test: fresh result, start time, listener notified
    void start_test(TestInfo info) {
        test_ = std::make_shared<TestInfo>(info);
        result_ = std::make_shared<TestResult>(std::move(info));
        assert_count_.store(0, std::memory_order_relaxed);
        start_time_ = std::chrono::steady_clock::now();
        log().debug("Test {} started", test_->full_name);
        listener_->test_started(*test_);
    }

    /// End the running test and forward its result to the listener
    void finish_test() {
        duration_ = std::chrono::steady_clock::now() - start_time_;
        log().debug("Test {} finished with {} assertions", test_ ? test_->full_name : "<ad-hoc>",
                    assert_count());
        listener_->test_finished(*result_);
    }

    const TestInfo* current_test() const { return test_.get(); }

    std::chrono::steady_clock::time_point start_time() const { return start_time_; }
    std::chrono::steady_clock::duration duration() const { return duration_; }

    void write_output(std::string_view text) { result_->write_output(text); }

  private:
    friend class ContextScope;

    static utils::Logger& log() {
        static utils::Logger logger("assertlab.context.ExecutionContext");
        return logger;
    }

    static ExecutionContext*& current_slot() {
        thread_local ExecutionContext* slot = nullptr;
        return slot;
    }

    const ExecutionContext* prior_ = nullptr;
    std::atomic<int> assert_count_{0};
    std::atomic<int> multiple_assert_level_{0};
    core::ValueFormatter formatter_;
    core::Tolerance default_tolerance_;
    std::shared_ptr<TestResult> result_;
    std::shared_ptr<TestListener> listener_;
    std::shared_ptr<const TestInfo> test_;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
    std::chrono::steady_clock::duration duration_{};
};

/// Makes a context current for the lifetime of the scope, then restores the previous one
class ContextScope {
  public:
    explicit ContextScope(ExecutionContext& context)
        : previous_(ExecutionContext::current_slot()) {
        ExecutionContext::current_slot() = &context;
    }

    ~ContextScope() { ExecutionContext::current_slot() = previous_; }

    ContextScope(const ContextScope&) = delete;
    ContextScope& operator=(const ContextScope&) = delete;

  private:
    ExecutionContext* previous_;
};

inline ContextScope ExecutionContext::establish_execution_environment() {
    return ContextScope(*this);
}

/// Runs a scope in a child of the current context
///
/// The child is current while the object lives; destruction restores exactly the
/// context that was current on entry, on every exit path.
class IsolatedContext {
  public:
    IsolatedContext()
        : prior_(&ExecutionContext::current()),
          context_(std::make_shared<ExecutionContext>(*prior_)), scope_(*context_) {}

    IsolatedContext(const IsolatedContext&) = delete;
    IsolatedContext& operator=(const IsolatedContext&) = delete;

    ExecutionContext& context() { return *context_; }
    ExecutionContext& prior() { return *prior_; }

  private:
    ExecutionContext* prior_;
    std::shared_ptr<ExecutionContext> context_;
    ContextScope scope_;
};

/// std::async that runs `work` with the caller's current context established
///
/// A context owned through a shared_ptr (isolated scopes, the ad-hoc context) is kept
/// alive until the work finishes. A root context owned any other way must outlive it.
template <typename F>
auto run_async(F&& work) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
    ExecutionContext* captured = &ExecutionContext::current();
    std::shared_ptr<ExecutionContext> keep_alive = captured->weak_from_this().lock();
    return std::async(std::launch::async,
                      [captured, keep_alive = std::move(keep_alive),
                       work = std::forward<F>(work)]() mutable {
                          auto scope = captured->establish_execution_environment();
                          return std::invoke(work);
                      });
}

} // namespace assertlab::context
