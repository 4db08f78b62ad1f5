#pragma once

/// @file equality.hpp
/// @brief Equality-based leaves: equal, equivalent, any-of and collection membership

#include <algorithm>
#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <assertlab/comparers/equality_comparer.hpp>
#include <assertlab/constraints/constraint.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/tolerance.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::constraints {

namespace detail {

inline bool is_tolerance_modifier(const Modifier& modifier) {
    return std::holds_alternative<modifiers::Within>(modifier) ||
           std::holds_alternative<modifiers::Unit>(modifier);
}

/// Fold a within or unit modifier into the tolerance gathered so far
inline core::Tolerance modified_tolerance(const core::Tolerance& current,
                                          const Modifier& modifier) {
    if (const auto* within = std::get_if<modifiers::Within>(&modifier)) {
        if (!current.is_unset_or_default()) {
            throw core::ConfigurationError(
                "Within modifier may appear only once in a constraint expression");
        }
        return within->tolerance;
    }
    ToleranceUnit unit = std::get<modifiers::Unit>(modifier).unit;
    if (current.is_unset_or_default()) {
        throw core::ConfigurationError(
            std::format("The {} modifier requires a preceding within", to_string(unit)));
    }
    switch (unit) {
    case ToleranceUnit::percent:
        return current.percent();
    case ToleranceUnit::ulps:
        return current.ulps();
    case ToleranceUnit::nanoseconds:
        return current.nanoseconds();
    case ToleranceUnit::microseconds:
        return current.microseconds();
    case ToleranceUnit::milliseconds:
        return current.milliseconds();
    case ToleranceUnit::seconds:
        return current.seconds();
    case ToleranceUnit::minutes:
        return current.minutes();
    }
    return current;
}

inline std::string join_positions(const std::vector<comparers::FailurePoint>& points) {
    std::string text;
    for (const auto& point : points) {
        text += (text.empty() ? "" : ", ") + std::to_string(point.position);
    }
    return text;
}

} // namespace detail

/// Result of an equality check, able to point at where two values diverge
class EqualConstraintResult : public ConstraintResult {
  public:
    EqualConstraintResult(ConstraintPtr constraint, core::Value actual, bool success,
                          core::Value expected, std::vector<comparers::FailurePoint> points)
        : ConstraintResult(std::move(constraint), std::move(actual), success),
          expected_(std::move(expected)), failure_points_(std::move(points)) {}

    const std::vector<comparers::FailurePoint>& failure_points() const {
        return failure_points_;
    }

    void write_additional_lines_to(MessageWriter& writer) const override {
        if (is_success()) {
            return;
        }
        const core::Value& actual = actual_value();
        if (expected_.is_string() && actual.is_string()) {
            write_string_difference(writer, expected_.as_string(), actual.as_string());
        }
        if (expected_.kind() == core::ValueKind::sequence &&
            actual.kind() == core::ValueKind::sequence) {
            std::size_t expected_size = expected_.as_sequence().items.size();
            std::size_t actual_size = actual.as_sequence().items.size();
            if (expected_size != actual_size) {
                writer.write_line(std::format("  Expected has {} items, actual has {} items",
                                              expected_size, actual_size));
            }
        }
        if (failure_points_.empty()) {
            return;
        }
        writer.write_line("  Values differ at index [" + detail::join_positions(failure_points_) +
                          "]");
        const auto& innermost = failure_points_.back();
        if (innermost.expected && innermost.actual) {
            writer.write_line("    Expected: " + writer.format(*innermost.expected));
            writer.write_line("    But was:  " + writer.format(*innermost.actual));
        } else if (innermost.expected) {
            writer.write_line("    Missing:  " + writer.format(*innermost.expected));
        } else if (innermost.actual) {
            writer.write_line("    Extra:    " + writer.format(*innermost.actual));
        }
    }

  private:
    static void write_string_difference(MessageWriter& writer, const std::string& expected,
                                        const std::string& actual) {
        auto [left, right] = std::ranges::mismatch(expected, actual);
        auto index = static_cast<std::size_t>(left - expected.begin());
        if (expected.size() == actual.size()) {
            writer.write_line(std::format(
                "  String lengths are both {}. Strings differ at index {}.", expected.size(),
                index));
        } else {
            writer.write_line(
                std::format("  Expected string length {} but was {}. Strings differ at index {}.",
                            expected.size(), actual.size(), index));
        }
    }

    core::Value expected_;
    std::vector<comparers::FailurePoint> failure_points_;
};

/// Deep equality through the comparer chain
class EqualConstraint : public Constraint {
  public:
    explicit EqualConstraint(core::Value expected)
        : EqualConstraint("equal", std::move(expected)) {}

    const core::Value& expected() const { return expected_; }
    const core::Tolerance& tolerance() const { return tolerance_; }
    const comparers::EqualityOptions& options() const { return options_; }

    void modify(const Modifier& modifier) override {
        if (detail::is_tolerance_modifier(modifier)) {
            tolerance_ = detail::modified_tolerance(tolerance_, modifier);
        } else if (std::holds_alternative<modifiers::IgnoreCase>(modifier)) {
            options_.ignore_case = true;
        } else if (std::holds_alternative<modifiers::AsCollection>(modifier)) {
            options_.compare_as_collection = true;
        } else {
            options_.in_any_order = true;
        }
    }

  protected:
    EqualConstraint(std::string name, core::Value expected)
        : Constraint(std::move(name)), expected_(std::move(expected)) {}

    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        comparers::EqualityComparer comparer(options_, context.default_floating_point_tolerance);
        core::Tolerance tolerance = tolerance_;
        bool success = comparer.are_equal(expected_, actual, tolerance);
        return std::make_unique<EqualConstraintResult>(self(), actual, success, expected_,
                                                       comparer.failure_points());
    }

    std::string describe() const override { return format(expected_) + modifier_suffix(); }

    std::string modifier_suffix(bool include_order = true) const {
        std::string text;
        if (tolerance_.mode() != core::ToleranceMode::none) {
            text += " " + tolerance_.to_string();
        }
        if (options_.ignore_case) {
            text += ", ignoring case";
        }
        if (options_.compare_as_collection) {
            text += ", as collection";
        }
        if (include_order && options_.in_any_order) {
            text += ", in any order";
        }
        return text;
    }

    core::Value expected_;
    core::Tolerance tolerance_ = core::Tolerance::default_tolerance();
    comparers::EqualityOptions options_;
};

/// Equality that ignores element order at every level
class EquivalentConstraint : public EqualConstraint {
  public:
    explicit EquivalentConstraint(core::Value expected)
        : EqualConstraint("equivalent", std::move(expected)) {
        options_.in_any_order = true;
    }

  protected:
    std::string describe() const override {
        return "equivalent to " + format(expected_) + modifier_suffix(false);
    }
};

/// Succeeds when the actual value equals any of the listed values
class AnyOfConstraint : public Constraint {
  public:
    explicit AnyOfConstraint(std::vector<core::Value> expected)
        : Constraint("any of"), expected_(std::move(expected)) {
        if (expected_.empty()) {
            throw core::ConfigurationError("any_of requires at least one expected value");
        }
    }

    void modify(const Modifier& modifier) override {
        if (!std::holds_alternative<modifiers::IgnoreCase>(modifier)) {
            Constraint::modify(modifier);
        }
        ignore_case_ = true;
    }

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        comparers::EqualityComparer comparer({.ignore_case = ignore_case_},
                                             context.default_floating_point_tolerance);
        bool success = std::ranges::any_of(
            expected_, [&](const core::Value& candidate) { return comparer.are_equal(candidate, actual); });
        return std::make_unique<ConstraintResult>(self(), actual, success);
    }

    std::string describe() const override {
        std::string text = "any of " + format(core::Value::sequence(expected_));
        return ignore_case_ ? text + ", ignoring case" : text;
    }

  private:
    std::vector<core::Value> expected_;
    bool ignore_case_ = false;
};

/// Succeeds when some item of the actual collection equals the expected value
class CollectionContainsConstraint : public Constraint {
  public:
    explicit CollectionContainsConstraint(core::Value expected)
        : Constraint("collection contains"),
          item_(std::make_shared<EqualConstraint>(std::move(expected))) {}

    /// Tolerance and case modifiers apply to the per-item comparison
    void modify(const Modifier& modifier) override { item_->modify(modifier); }

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        auto items = collection_items(actual);
        if (!items) {
            throw core::ConfigurationError(
                std::format("The actual value must be a collection, not {}",
                            core::to_string(actual.kind())));
        }
        bool success = std::ranges::any_of(*items, [&](const core::Value& item) {
            return item_->apply_to(item, context)->is_success();
        });
        return std::make_unique<ConstraintResult>(self(), actual, success);
    }

    std::string describe() const override { return "some item equal to " + item_->description(); }

  private:
    std::shared_ptr<EqualConstraint> item_;
};

} // namespace assertlab::constraints
