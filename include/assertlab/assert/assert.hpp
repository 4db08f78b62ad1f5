#pragma once

/// @file assert.hpp
/// @brief Public assertion surface: that, contains, pass, fail, warn, ignore, inconclusive, multiple
///
/// Outcomes are recorded on the context's TestResult. Outside a multiple-assertion block
/// a failure, pass, ignore or inconclusive outcome then unwinds with the matching
/// exception; warnings never unwind. Inside a block every outcome is only recorded and
/// the outermost block reports them together when it exits. Configuration errors are
/// never deferred.

#include <concepts>
#include <cstddef>
#include <format>
#include <functional>
#include <future>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <assertlab/constraints/constraint.hpp>
#include <assertlab/constraints/message_writer.hpp>
#include <assertlab/constraints/syntax.hpp>
#include <assertlab/context/execution_context.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/value.hpp>
#include <assertlab/utils/logger.hpp>

namespace assertlab {

/// Anything `that` accepts as its constraint argument
template <typename C>
concept ConstraintArgument = constraints::ConstraintSource<C> ||
                             std::convertible_to<const C&, constraints::ConstraintPtr>;

namespace detail {

inline utils::Logger& assert_log() {
    static utils::Logger logger("assertlab.Assert");
    return logger;
}

/// Holds one level of multiple-assertion nesting for its lifetime
class MultipleScope {
  public:
    explicit MultipleScope(context::ExecutionContext& context) : context_(context) {
        context_.enter_multiple();
    }

    ~MultipleScope() { context_.exit_multiple(); }

    MultipleScope(const MultipleScope&) = delete;
    MultipleScope& operator=(const MultipleScope&) = delete;

  private:
    context::ExecutionContext& context_;
};

[[noreturn]] inline void throw_outcome(core::AssertionStatus status, const std::string& message) {
    switch (status) {
    case core::AssertionStatus::passed:
        throw core::SuccessException(message);
    case core::AssertionStatus::ignored:
        throw core::IgnoreException(message);
    case core::AssertionStatus::inconclusive:
        throw core::InconclusiveException(message);
    default:
        throw core::AssertionException(message);
    }
}

} // namespace detail

/// Assertion surface bound to an explicit execution context
class Asserter {
  public:
    explicit Asserter(context::ExecutionContext& context) : context_(context) {}

    context::ExecutionContext& context() { return context_; }

    template <typename T, ConstraintArgument C>
    void that(const T& actual, const C& constraint) {
        apply(core::Value::from(actual), constraints::to_constraint(constraint), {});
    }

    template <typename T, ConstraintArgument C, typename... Args>
    void that(const T& actual, const C& constraint, std::format_string<Args...> message,
              Args&&... args) {
        apply(core::Value::from(actual), constraints::to_constraint(constraint),
              std::format(message, std::forward<Args>(args)...));
    }

    void that(bool condition) { that(condition, constraints::Is::true_()); }

    template <typename... Args>
    void that(bool condition, std::format_string<Args...> message, Args&&... args) {
        apply(core::Value(condition), constraints::Is::true_().resolve(),
              std::format(message, std::forward<Args>(args)...));
    }

    /// Collection membership: some item of `collection` equals `expected`
    template <typename E, typename T>
    void contains(const E& expected, const T& collection) {
        that(collection, constraints::Has::member(expected));
    }

    void pass() { report(core::AssertionStatus::passed, {}); }
    void fail() { report(core::AssertionStatus::failed, {}); }
    void warn() { report(core::AssertionStatus::warning, {}); }
    void ignore() { report(core::AssertionStatus::ignored, {}); }
    void inconclusive() { report(core::AssertionStatus::inconclusive, {}); }

    template <typename... Args>
    void pass(std::format_string<Args...> message, Args&&... args) {
        report(core::AssertionStatus::passed, std::format(message, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void fail(std::format_string<Args...> message, Args&&... args) {
        report(core::AssertionStatus::failed, std::format(message, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warn(std::format_string<Args...> message, Args&&... args) {
        report(core::AssertionStatus::warning, std::format(message, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void ignore(std::format_string<Args...> message, Args&&... args) {
        report(core::AssertionStatus::ignored, std::format(message, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void inconclusive(std::format_string<Args...> message, Args&&... args) {
        report(core::AssertionStatus::inconclusive,
               std::format(message, std::forward<Args>(args)...));
    }

    /// Run `block` with outcomes deferred
    ///
    /// A block returning std::future<void> is the asynchronous form: the future is
    /// waited on before the nesting level drops, so outcomes recorded by the async work
    /// belong to this block. The outermost block throws MultipleAssertException if any
    /// deferred entry failed; otherwise ignore, inconclusive and pass outcomes unwind in
    /// that order of precedence.
    template <typename F>
        requires std::invocable<F&>
    void multiple(F&& block) {
        bool outermost = context_.multiple_assert_level() == 0;
        std::size_t first = context_.current_result().assertion_count();
        {
            detail::MultipleScope scope(context_);
            if constexpr (std::is_same_v<std::invoke_result_t<F&>, std::future<void>>) {
                std::future<void> pending = std::invoke(block);
                pending.get();
            } else {
                std::invoke(block);
            }
        }
        if (outermost) {
            flush(first);
        }
    }

  private:
    void apply(const core::Value& actual, const constraints::ConstraintPtr& constraint,
               const std::string& message) {
        context_.increment_assert_count();
        constraints::ResultPtr result = constraint->apply_to(actual, context_.evaluation_context());
        if (result->is_success()) {
            return;
        }
        constraints::MessageWriter writer(context_.current_value_formatter());
        writer.write_message_line(message);
        result->write_message_to(writer);
        report(core::AssertionStatus::failed, writer.str());
    }

    void report(core::AssertionStatus status, std::string message) {
        context_.current_result().record_assertion(status, message);
        if (status == core::AssertionStatus::warning) {
            detail::assert_log().debug("Warning recorded: {}", message);
            return;
        }
        if (context_.multiple_assert_level() > 0) {
            detail::assert_log().debug("Deferred {} outcome", core::to_string(status));
            return;
        }
        detail::throw_outcome(status, message);
    }

    void flush(std::size_t first) {
        std::vector<context::AssertionRecord> records =
            context_.current_result().assertions_since(first);
        if (records.empty()) {
            return;
        }
        detail::assert_log().info("Multiple block finished with {} deferred outcomes",
                                  records.size());

        std::vector<core::DeferredOutcome> outcomes;
        outcomes.reserve(records.size());
        for (const auto& record : records) {
            outcomes.push_back({record.status, record.message});
        }

        auto find = [&](core::AssertionStatus status) -> const context::AssertionRecord* {
            for (const auto& record : records) {
                if (record.status == status) {
                    return &record;
                }
            }
            return nullptr;
        };

        if (find(core::AssertionStatus::failed) || find(core::AssertionStatus::error)) {
            throw core::MultipleAssertException(std::move(outcomes));
        }
        for (auto status : {core::AssertionStatus::ignored, core::AssertionStatus::inconclusive,
                            core::AssertionStatus::passed}) {
            if (const auto* record = find(status)) {
                detail::throw_outcome(status, record->message);
            }
        }
    }

    context::ExecutionContext& context_;
};

/// Static facade over the calling thread's current execution context
struct Assert {
    template <typename T, ConstraintArgument C>
    static void that(const T& actual, const C& constraint) {
        current().that(actual, constraint);
    }

    template <typename T, ConstraintArgument C, typename... Args>
    static void that(const T& actual, const C& constraint, std::format_string<Args...> message,
                     Args&&... args) {
        current().that(actual, constraint, message, std::forward<Args>(args)...);
    }

    static void that(bool condition) { current().that(condition); }

    template <typename... Args>
    static void that(bool condition, std::format_string<Args...> message, Args&&... args) {
        current().that(condition, message, std::forward<Args>(args)...);
    }

    template <typename E, typename T>
    static void contains(const E& expected, const T& collection) {
        current().contains(expected, collection);
    }

    static void pass() { current().pass(); }
    static void fail() { current().fail(); }
    static void warn() { current().warn(); }
    static void ignore() { current().ignore(); }
    static void inconclusive() { current().inconclusive(); }

    template <typename... Args>
    static void pass(std::format_string<Args...> message, Args&&... args) {
        current().pass(message, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fail(std::format_string<Args...> message, Args&&... args) {
        current().fail(message, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(std::format_string<Args...> message, Args&&... args) {
        current().warn(message, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void ignore(std::format_string<Args...> message, Args&&... args) {
        current().ignore(message, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void inconclusive(std::format_string<Args...> message, Args&&... args) {
        current().inconclusive(message, std::forward<Args>(args)...);
    }

    template <typename F>
        requires std::invocable<F&>
    static void multiple(F&& block) {
        current().multiple(std::forward<F>(block));
    }

  private:
    static Asserter current() { return Asserter(context::ExecutionContext::current()); }
};

} // namespace assertlab
