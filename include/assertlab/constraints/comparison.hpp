#pragma once

/// @file comparison.hpp
/// @brief Ordering leaves: greater than, less than and their inclusive forms

#include <compare>
#include <format>
#include <memory>
#include <string>
#include <utility>

#include <assertlab/comparers/numerics.hpp>
#include <assertlab/constraints/constraint.hpp>
#include <assertlab/constraints/equality.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/tolerance.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::constraints {

/// Order two values of comparable kinds
///
/// @throws core::ConfigurationError when the kinds have no ordering between them
inline std::partial_ordering compare_values(const core::Value& x, const core::Value& y) {
    if (x.is_numeric() && y.is_numeric()) {
        return comparers::numerics::compare(x, y);
    }
    if (x.is_string() && y.is_string()) {
        return x.as_string() <=> y.as_string();
    }
    if (x.is_duration() && y.is_duration()) {
        return x.as_duration() <=> y.as_duration();
    }
    throw core::ConfigurationError(std::format("Cannot compare a {} value with a {} value",
                                               core::to_string(x.kind()),
                                               core::to_string(y.kind())));
}

/// Shared behavior of the ordering leaves
///
/// The tolerance widens the expected side: "greater than" checks against the lower
/// bound and "less than" against the upper bound. A null actual value fails.
class ComparisonConstraint : public Constraint {
  public:
    const core::Value& expected() const { return expected_; }

    void modify(const Modifier& modifier) override {
        if (!detail::is_tolerance_modifier(modifier)) {
            Constraint::modify(modifier);
        }
        tolerance_ = detail::modified_tolerance(tolerance_, modifier);
    }

  protected:
    ComparisonConstraint(std::string name, std::string phrase, core::Value expected)
        : Constraint(std::move(name)), phrase_(std::move(phrase)), expected_(std::move(expected)) {
        if (expected_.is_null()) {
            throw core::ConfigurationError(
                std::format("The {} constraint requires a non-null expected value", display_name()));
        }
    }

    /// Decide from the ordering of the actual value against the widened bounds
    virtual bool accepts(const core::Value& actual, const core::Range& range) const = 0;

    ResultPtr evaluate(const core::Value& actual, const EvaluationContext&) const override {
        if (actual.is_null()) {
            return std::make_unique<ConstraintResult>(self(), actual, false);
        }
        // Validate the pairing before the tolerance touches the expected value
        compare_values(actual, expected_);
        core::Range range = tolerance_.apply_to_value(expected_);
        return std::make_unique<ConstraintResult>(self(), actual, accepts(actual, range));
    }

    std::string describe() const override {
        std::string text = phrase_ + " " + format(expected_);
        if (!tolerance_.is_unset_or_default()) {
            text += " within " + tolerance_.to_string();
        }
        return text;
    }

  private:
    std::string phrase_;
    core::Value expected_;
    core::Tolerance tolerance_ = core::Tolerance::default_tolerance();
};

class GreaterThanConstraint : public ComparisonConstraint {
  public:
    explicit GreaterThanConstraint(core::Value expected)
        : ComparisonConstraint("greater than", "greater than", std::move(expected)) {}

  protected:
    bool accepts(const core::Value& actual, const core::Range& range) const override {
        return compare_values(actual, range.lower_bound) > 0;
    }
};

class GreaterThanOrEqualConstraint : public ComparisonConstraint {
  public:
    explicit GreaterThanOrEqualConstraint(core::Value expected)
        : ComparisonConstraint("greater than or equal", "greater than or equal to",
                               std::move(expected)) {}

  protected:
    bool accepts(const core::Value& actual, const core::Range& range) const override {
        return compare_values(actual, range.lower_bound) >= 0;
    }
};

class LessThanConstraint : public ComparisonConstraint {
  public:
    explicit LessThanConstraint(core::Value expected)
        : ComparisonConstraint("less than", "less than", std::move(expected)) {}

  protected:
    bool accepts(const core::Value& actual, const core::Range& range) const override {
        return compare_values(actual, range.upper_bound) < 0;
    }
};

class LessThanOrEqualConstraint : public ComparisonConstraint {
  public:
    explicit LessThanOrEqualConstraint(core::Value expected)
        : ComparisonConstraint("less than or equal", "less than or equal to",
                               std::move(expected)) {}

  protected:
    bool accepts(const core::Value& actual, const core::Range& range) const override {
        return compare_values(actual, range.upper_bound) <= 0;
    }
};

} // namespace assertlab::constraints
