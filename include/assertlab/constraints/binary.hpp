#pragma once

/// @file binary.hpp
/// @brief Short-circuiting AND and OR combinators

#include <memory>
#include <string>
#include <utility>

#include <assertlab/constraints/constraint.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::constraints {

/// Result of a binary combinator; `right()` is null when evaluation short-circuited
class BinaryConstraintResult : public ConstraintResult {
  public:
    BinaryConstraintResult(ConstraintPtr constraint, core::Value actual, bool success,
                           ResultPtr left, ResultPtr right)
        : ConstraintResult(std::move(constraint), std::move(actual), success),
          left_(std::move(left)), right_(std::move(right)) {}

    const ConstraintResult& left() const { return *left_; }
    const ConstraintResult* right() const { return right_.get(); }

  protected:
    ResultPtr left_;
    ResultPtr right_;
};

class AndConstraintResult : public BinaryConstraintResult {
  public:
    using BinaryConstraintResult::BinaryConstraintResult;

    void write_actual_value_to(MessageWriter& writer) const override {
        failing_branch().write_actual_value_to(writer);
    }

    void write_additional_lines_to(MessageWriter& writer) const override {
        if (is_success()) {
            return;
        }
        const ConstraintResult& failing = failing_branch();
        writer.write_line("  Failing branch: " + failing.description());
        failing.write_additional_lines_to(writer);
    }

  private:
    const ConstraintResult& failing_branch() const {
        return left_->is_success() && right_ ? *right_ : *left_;
    }
};

class OrConstraintResult : public BinaryConstraintResult {
  public:
    using BinaryConstraintResult::BinaryConstraintResult;

    /// Both branches failed; the left one was evaluated first and is reported
    void write_additional_lines_to(MessageWriter& writer) const override {
        if (!is_success()) {
            left_->write_additional_lines_to(writer);
        }
    }
};

class BinaryConstraint : public Constraint {
  public:
    const Constraint& left() const { return *left_; }
    const Constraint& right() const { return *right_; }

  protected:
    BinaryConstraint(std::string name, std::string conjunction, ConstraintPtr left,
                     ConstraintPtr right)
        : Constraint(std::move(name)), conjunction_(std::move(conjunction)),
          left_(std::move(left)), right_(std::move(right)) {
        if (!left_ || !right_) {
            throw core::ConfigurationError("A binary constraint requires two operands");
        }
    }

    std::string describe() const override {
        return left_->description() + " " + conjunction_ + " " + right_->description();
    }

    std::string conjunction_;
    ConstraintPtr left_;
    ConstraintPtr right_;
};

/// Right side is not evaluated when the left side fails
class AndConstraint : public BinaryConstraint {
  public:
    AndConstraint(ConstraintPtr left, ConstraintPtr right)
        : BinaryConstraint("and", "and", std::move(left), std::move(right)) {}

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        ResultPtr left_result = left_->apply_to(actual, context);
        if (!left_result->is_success()) {
            return std::make_unique<AndConstraintResult>(self(), actual, false,
                                                         std::move(left_result), nullptr);
        }
        ResultPtr right_result = right_->apply_to(actual, context);
        bool success = right_result->is_success();
        return std::make_unique<AndConstraintResult>(self(), actual, success,
                                                     std::move(left_result),
                                                     std::move(right_result));
    }
};

/// Right side is not evaluated when the left side succeeds
class OrConstraint : public BinaryConstraint {
  public:
    OrConstraint(ConstraintPtr left, ConstraintPtr right)
        : BinaryConstraint("or", "or", std::move(left), std::move(right)) {}

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        ResultPtr left_result = left_->apply_to(actual, context);
        if (left_result->is_success()) {
            return std::make_unique<OrConstraintResult>(self(), actual, true,
                                                        std::move(left_result), nullptr);
        }
        ResultPtr right_result = right_->apply_to(actual, context);
        bool success = right_result->is_success();
        return std::make_unique<OrConstraintResult>(self(), actual, success,
                                                    std::move(left_result),
                                                    std::move(right_result));
    }
};

} // namespace assertlab::constraints
