#pragma once

/// @file prefix.hpp
/// @brief Constraints that wrap a base constraint: not, item quantifiers, members, attributes

#include <algorithm>
#include <format>
#include <memory>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

#include <assertlab/constraints/constraint.hpp>
#include <assertlab/constraints/equality.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::constraints {

/// Base for constraints that prepend text to a wrapped constraint's description
class PrefixConstraint : public Constraint {
  public:
    const Constraint& base_constraint() const { return *base_; }

  protected:
    PrefixConstraint(std::string name, std::string prefix, ConstraintPtr base)
        : Constraint(std::move(name)), prefix_(std::move(prefix)), base_(std::move(base)) {
        if (!base_) {
            throw core::ConfigurationError(
                std::format("The {} constraint requires a base constraint", display_name()));
        }
    }

    /// A plain equality base reads as "<prefix> equal to <expected>"
    std::string describe() const override {
        if (typeid(*base_) == typeid(EqualConstraint)) {
            return prefix_ + " equal to " + base_->description();
        }
        return prefix_ + " " + base_->description();
    }

    const ConstraintPtr& base() const { return base_; }

  private:
    std::string prefix_;
    ConstraintPtr base_;
};

class NotConstraint : public PrefixConstraint {
  public:
    explicit NotConstraint(ConstraintPtr base)
        : PrefixConstraint("not", "not", std::move(base)) {}

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        ResultPtr inner = base()->apply_to(actual, context);
        return std::make_unique<ConstraintResult>(self(), inner->actual_value(),
                                                  !inner->is_success());
    }
};

/// Shared collection handling for the item quantifiers
class ItemsConstraint : public PrefixConstraint {
  protected:
    using PrefixConstraint::PrefixConstraint;

    /// Number of items that satisfy the base constraint, plus the item count
    std::pair<std::size_t, std::size_t> count_matches(const core::Value& actual,
                                                      const EvaluationContext& context) const {
        auto items = collection_items(actual);
        if (!items) {
            throw core::ConfigurationError(
                std::format("The actual value must be a collection, not {}",
                            core::to_string(actual.kind())));
        }
        auto matched = std::ranges::count_if(*items, [&](const core::Value& item) {
            return base()->apply_to(item, context)->is_success();
        });
        return {static_cast<std::size_t>(matched), items->size()};
    }
};

class AllItemsConstraint : public ItemsConstraint {
  public:
    explicit AllItemsConstraint(ConstraintPtr base)
        : ItemsConstraint("all items", "all items", std::move(base)) {}

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        auto [matched, total] = count_matches(actual, context);
        return std::make_unique<ConstraintResult>(self(), actual, matched == total);
    }
};

class SomeItemsConstraint : public ItemsConstraint {
  public:
    explicit SomeItemsConstraint(ConstraintPtr base)
        : ItemsConstraint("some items", "some item", std::move(base)) {}

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        auto [matched, total] = count_matches(actual, context);
        return std::make_unique<ConstraintResult>(self(), actual, matched > 0);
    }
};

class NoItemConstraint : public ItemsConstraint {
  public:
    explicit NoItemConstraint(ConstraintPtr base)
        : ItemsConstraint("no item", "no item", std::move(base)) {}

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        auto [matched, total] = count_matches(actual, context);
        return std::make_unique<ConstraintResult>(self(), actual, matched == 0);
    }
};

/// Applies the base constraint to a named member of a record
class PropertyConstraint : public PrefixConstraint {
  public:
    PropertyConstraint(std::string name, ConstraintPtr base)
        : PrefixConstraint("property", "property " + name, std::move(base)),
          name_(std::move(name)) {}

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        if (actual.kind() != core::ValueKind::record) {
            throw core::ConfigurationError(std::format(
                "Property {} requires a record, not {}", name_, core::to_string(actual.kind())));
        }
        const core::Value* member = actual.as_record().find_member(name_);
        if (member == nullptr) {
            throw core::ConfigurationError(std::format("Property {} was not found on {}", name_,
                                                       actual.as_record().type.name));
        }
        ResultPtr inner = base()->apply_to(*member, context);
        return std::make_unique<ConstraintResult>(self(), *member, inner->is_success());
    }

  private:
    std::string name_;
};

/// Resolved form of a property operator with nothing following it
class PropertyExistsConstraint : public Constraint {
  public:
    explicit PropertyExistsConstraint(std::string name)
        : Constraint("property exists"), name_(std::move(name)) {}

  protected:
    ResultPtr evaluate(const core::Value& actual, const EvaluationContext&) const override {
        if (actual.is_null()) {
            throw core::ConfigurationError(
                std::format("Cannot look up property {} on a null value", name_));
        }
        bool found = actual.kind() == core::ValueKind::record &&
                     actual.as_record().find_member(name_) != nullptr;
        return std::make_unique<ConstraintResult>(self(), actual, found);
    }

    std::string describe() const override { return "property " + name_; }

  private:
    std::string name_;
};

namespace detail {

inline void require_attribute_type(const core::TypeDescriptor& type) {
    if (!type.is_attribute()) {
        throw core::ConfigurationError(std::format("Type {} is not an attribute", type.name));
    }
}

} // namespace detail

/// Applies the base constraint to an attribute attached to the actual record
///
/// Construction fails for a type that is not an attribute; evaluation fails with a
/// configuration error when the attribute is absent.
class AttributeConstraint : public PrefixConstraint {
  public:
    AttributeConstraint(core::TypeDescriptor type, ConstraintPtr base)
        : PrefixConstraint("attribute", "attribute " + type.name, std::move(base)),
          type_(std::move(type)) {
        detail::require_attribute_type(type_);
    }

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        const core::Value* found = actual.kind() == core::ValueKind::record
                                       ? actual.as_record().find_attribute(type_)
                                       : nullptr;
        if (found == nullptr) {
            throw core::ConfigurationError(std::format("Attribute {} was not found", type_.name));
        }
        ResultPtr inner = base()->apply_to(*found, context);
        return std::make_unique<ConstraintResult>(self(), *found, inner->is_success());
    }

  private:
    core::TypeDescriptor type_;
};

/// Resolved form of an attribute operator with nothing following it
class AttributeExistsConstraint : public Constraint {
  public:
    explicit AttributeExistsConstraint(core::TypeDescriptor type)
        : Constraint("attribute exists"), type_(std::move(type)) {
        detail::require_attribute_type(type_);
    }

  protected:
    ResultPtr evaluate(const core::Value& actual, const EvaluationContext&) const override {
        bool found = actual.kind() == core::ValueKind::record &&
                     actual.as_record().find_attribute(type_) != nullptr;
        return std::make_unique<ConstraintResult>(self(), actual, found);
    }

    std::string describe() const override { return "type with attribute <" + type_.name + ">"; }

  private:
    core::TypeDescriptor type_;
};

} // namespace assertlab::constraints
