#pragma once

/// @file basic.hpp
/// @brief Leaves with no expected operand: null, true, false and empty

#include <format>
#include <memory>
#include <string>

#include <assertlab/constraints/constraint.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::constraints {

class NullConstraint : public Constraint {
  public:
    NullConstraint() : Constraint("null") {}

  protected:
    ResultPtr evaluate(const core::Value& actual, const EvaluationContext&) const override {
        return std::make_unique<ConstraintResult>(self(), actual, actual.is_null());
    }

    std::string describe() const override { return "null"; }
};

class TrueConstraint : public Constraint {
  public:
    TrueConstraint() : Constraint("true") {}

  protected:
    ResultPtr evaluate(const core::Value& actual, const EvaluationContext&) const override {
        bool success = actual.kind() == core::ValueKind::boolean && actual.as_bool();
        return std::make_unique<ConstraintResult>(self(), actual, success);
    }

    std::string describe() const override { return "true"; }
};

class FalseConstraint : public Constraint {
  public:
    FalseConstraint() : Constraint("false") {}

  protected:
    ResultPtr evaluate(const core::Value& actual, const EvaluationContext&) const override {
        bool success = actual.kind() == core::ValueKind::boolean && !actual.as_bool();
        return std::make_unique<ConstraintResult>(self(), actual, success);
    }

    std::string describe() const override { return "false"; }
};

/// Empty string or collection; other kinds are a configuration error
class EmptyConstraint : public Constraint {
  public:
    EmptyConstraint() : Constraint("empty") {}

  protected:
    ResultPtr evaluate(const core::Value& actual, const EvaluationContext&) const override {
        if (actual.is_null()) {
            return std::make_unique<ConstraintResult>(self(), actual, false);
        }
        if (actual.is_string()) {
            return std::make_unique<ConstraintResult>(self(), actual, actual.as_string().empty());
        }
        auto items = collection_items(actual);
        if (!items) {
            throw core::ConfigurationError(std::format(
                "The actual value must be a string or collection, not {}",
                core::to_string(actual.kind())));
        }
        return std::make_unique<ConstraintResult>(self(), actual, items->empty());
    }

    std::string describe() const override { return "<empty>"; }
};

} // namespace assertlab::constraints
