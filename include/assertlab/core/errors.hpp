#pragma once

/// @file errors.hpp
/// @brief Outcome signals and configuration errors
///
/// Assertion outcomes are reported by value everywhere inside the engine. Only the
/// facade turns them into exceptions, and only when the calling flow is not inside a
/// multiple-assertion block. Configuration errors are raised immediately.

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace assertlab::core {

/// Outcome kinds recorded against a test
enum class AssertionStatus { passed, inconclusive, warning, ignored, failed, error };

inline const char* to_string(AssertionStatus status) {
    switch (status) {
    case AssertionStatus::passed:
        return "Passed";
    case AssertionStatus::inconclusive:
        return "Inconclusive";
    case AssertionStatus::warning:
        return "Warning";
    case AssertionStatus::ignored:
        return "Ignored";
    case AssertionStatus::failed:
        return "Failed";
    case AssertionStatus::error:
        return "Error";
    }
    return "Unknown";
}

/// Base for every unwind-style outcome signal
class ResultStateException : public std::runtime_error {
  public:
    ResultStateException(AssertionStatus status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    AssertionStatus status() const noexcept { return status_; }

  private:
    AssertionStatus status_;
};

/// Thrown when an assertion fails outside a multiple-assertion block
class AssertionException : public ResultStateException {
  public:
    explicit AssertionException(const std::string& message)
        : ResultStateException(AssertionStatus::failed, message) {}
};

/// Thrown by Assert::pass to end a test early with success
class SuccessException : public ResultStateException {
  public:
    explicit SuccessException(const std::string& message)
        : ResultStateException(AssertionStatus::passed, message) {}
};

/// Thrown by Assert::ignore
class IgnoreException : public ResultStateException {
  public:
    explicit IgnoreException(const std::string& message)
        : ResultStateException(AssertionStatus::ignored, message) {}
};

/// Thrown by Assert::inconclusive
class InconclusiveException : public ResultStateException {
  public:
    explicit InconclusiveException(const std::string& message)
        : ResultStateException(AssertionStatus::inconclusive, message) {}
};

/// One outcome captured while a multiple-assertion block was active
struct DeferredOutcome {
    AssertionStatus status;
    std::string message;
};

/// Aggregate failure raised when the outermost multiple-assertion block exits
class MultipleAssertException : public AssertionException {
  public:
    explicit MultipleAssertException(std::vector<DeferredOutcome> outcomes)
        : AssertionException(compose(outcomes)), outcomes_(std::move(outcomes)) {}

    const std::vector<DeferredOutcome>& outcomes() const noexcept { return outcomes_; }

  private:
    static std::string compose(const std::vector<DeferredOutcome>& outcomes) {
        std::string text = "Multiple failures or warnings in test:";
        int index = 1;
        for (const auto& outcome : outcomes) {
            text += "\n  " + std::to_string(index++) + ") " + to_string(outcome.status);
            if (!outcome.message.empty()) {
                text += ": " + outcome.message;
            }
        }
        return text;
    }

    std::vector<DeferredOutcome> outcomes_;
};

/// Malformed constraint construction or use; never deferred
class ConfigurationError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/// Tolerance applied to an incompatible value or built with an invalid amount
class ToleranceError : public ConfigurationError {
  public:
    using ConfigurationError::ConfigurationError;
};

} // namespace assertlab::core
