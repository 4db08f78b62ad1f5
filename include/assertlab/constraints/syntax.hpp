#pragma once

/// @file syntax.hpp
/// @brief Fluent constraint grammar: Is, Has, Does and the C++ logical operators
///
/// Every entry point starts a fresh ConstraintBuilder. Prefix calls such as `not_()` or
/// `all()` return a ConstraintExpression awaiting its operand; leaf calls return a
/// FluentConstraint that accepts modifiers for that leaf, can be joined with `and_()` /
/// `or_()`, and resolves to a single constraint tree.
///
/// @code
/// Assert::that(x, Is::greater_than(1).and_().less_than(10));
/// Assert::that(y, Is::equal_to(2.0).within(5).percent());
/// Assert::that(items, Has::all().not_().null() || Is::empty());
/// @endcode

#include <chrono>
#include <concepts>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <assertlab/constraints/basic.hpp>
#include <assertlab/constraints/binary.hpp>
#include <assertlab/constraints/comparison.hpp>
#include <assertlab/constraints/constraint.hpp>
#include <assertlab/constraints/equality.hpp>
#include <assertlab/constraints/operators.hpp>
#include <assertlab/constraints/path.hpp>
#include <assertlab/constraints/prefix.hpp>
#include <assertlab/constraints/string.hpp>
#include <assertlab/core/tolerance.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::constraints {

class FluentConstraint;
class ResolvableConstraintExpression;

/// Partial expression waiting for a constraint
class ConstraintExpression {
  public:
    ConstraintExpression() : builder_(std::make_shared<ConstraintBuilder>()) {}
    explicit ConstraintExpression(std::shared_ptr<ConstraintBuilder> builder)
        : builder_(std::move(builder)) {}

    ConstraintExpression not_() const { return append_operator(std::make_shared<NotOperator>()); }
    ConstraintExpression all() const { return append_operator(std::make_shared<AllOperator>()); }
    ConstraintExpression some() const { return append_operator(std::make_shared<SomeOperator>()); }
    ConstraintExpression none() const { return append_operator(std::make_shared<NoneOperator>()); }

    ResolvableConstraintExpression property(std::string name) const;
    ResolvableConstraintExpression attribute(core::TypeDescriptor type) const;

    template <typename A>
    ResolvableConstraintExpression attribute() const;

    template <typename T>
    FluentConstraint equal_to(const T& expected) const;

    template <typename T>
    FluentConstraint equivalent_to(const T& expected) const;

    template <typename T>
    FluentConstraint greater_than(const T& expected) const;

    template <typename T>
    FluentConstraint greater_than_or_equal_to(const T& expected) const;

    template <typename T>
    FluentConstraint less_than(const T& expected) const;

    template <typename T>
    FluentConstraint less_than_or_equal_to(const T& expected) const;

    template <typename... T>
    FluentConstraint any_of(const T&... expected) const;

    template <typename T>
    FluentConstraint member(const T& expected) const;

    template <typename T>
    FluentConstraint contain(const T& expected) const;

    FluentConstraint null() const;
    FluentConstraint true_() const;
    FluentConstraint false_() const;
    FluentConstraint empty() const;

    FluentConstraint start_with(std::string expected) const;
    FluentConstraint end_with(std::string expected) const;
    FluentConstraint contain_substring(std::string expected) const;
    FluentConstraint match(std::string pattern) const;

    FluentConstraint same_path(std::string expected) const;
    FluentConstraint sub_path_of(std::string expected) const;
    FluentConstraint same_path_or_under(std::string expected) const;

    /// Use an already built constraint as the operand
    FluentConstraint matches(ConstraintPtr constraint) const;

  protected:
    ConstraintExpression append_operator(std::shared_ptr<const ConstraintOperator> op) const {
        builder_->append(std::move(op));
        return ConstraintExpression(builder_);
    }

    FluentConstraint append_leaf(std::shared_ptr<Constraint> leaf) const;

    std::shared_ptr<ConstraintBuilder> builder_;
};

/// Expression ending in a self-resolving operator; complete as it stands
class ResolvableConstraintExpression : public ConstraintExpression {
  public:
    using ConstraintExpression::ConstraintExpression;

    ConstraintExpression and_() const { return append_operator(std::make_shared<AndOperator>()); }
    ConstraintExpression or_() const { return append_operator(std::make_shared<OrOperator>()); }

    ConstraintPtr resolve() const { return builder_->resolve(); }
};

/// Expression whose last token is a leaf; modifiers apply to that leaf
class FluentConstraint {
  public:
    FluentConstraint(std::shared_ptr<ConstraintBuilder> builder, std::shared_ptr<Constraint> leaf)
        : builder_(std::move(builder)), leaf_(std::move(leaf)) {}

    FluentConstraint within(double amount) const {
        return modify(modifiers::Within{core::Tolerance(amount)});
    }

    template <typename Rep, typename Period>
    FluentConstraint within(std::chrono::duration<Rep, Period> span) const {
        return modify(modifiers::Within{core::Tolerance(span)});
    }

    FluentConstraint within(const core::Tolerance& tolerance) const {
        return modify(modifiers::Within{tolerance});
    }

    FluentConstraint percent() const { return unit(ToleranceUnit::percent); }
    FluentConstraint ulps() const { return unit(ToleranceUnit::ulps); }
    FluentConstraint nanoseconds() const { return unit(ToleranceUnit::nanoseconds); }
    FluentConstraint microseconds() const { return unit(ToleranceUnit::microseconds); }
    FluentConstraint milliseconds() const { return unit(ToleranceUnit::milliseconds); }
    FluentConstraint seconds() const { return unit(ToleranceUnit::seconds); }
    FluentConstraint minutes() const { return unit(ToleranceUnit::minutes); }

    FluentConstraint ignore_case() const { return modify(modifiers::IgnoreCase{}); }
    FluentConstraint as_collection() const { return modify(modifiers::AsCollection{}); }
    FluentConstraint in_any_order() const { return modify(modifiers::InAnyOrder{}); }

    ConstraintExpression and_() const {
        builder_->append(std::make_shared<AndOperator>());
        return ConstraintExpression(builder_);
    }

    ConstraintExpression or_() const {
        builder_->append(std::make_shared<OrOperator>());
        return ConstraintExpression(builder_);
    }

    ConstraintPtr resolve() const { return builder_->resolve(); }

  private:
    FluentConstraint modify(const Modifier& modifier) const {
        leaf_->apply_modifier(modifier);
        return *this;
    }

    FluentConstraint unit(ToleranceUnit value) const { return modify(modifiers::Unit{value}); }

    std::shared_ptr<ConstraintBuilder> builder_;
    std::shared_ptr<Constraint> leaf_;
};

/// Anything that resolves to a constraint tree
template <typename T>
concept ConstraintSource = requires(const T& source) {
    { source.resolve() } -> std::convertible_to<ConstraintPtr>;
};

/// Constraint assembled with `&&`, `||` or `!`
class ComposedConstraint {
  public:
    explicit ComposedConstraint(ConstraintPtr constraint) : constraint_(std::move(constraint)) {}

    ConstraintPtr resolve() const { return constraint_; }

  private:
    ConstraintPtr constraint_;
};

inline ConstraintPtr to_constraint(ConstraintPtr constraint) { return constraint; }

template <ConstraintSource T>
ConstraintPtr to_constraint(const T& source) {
    return source.resolve();
}

template <ConstraintSource L, ConstraintSource R>
ComposedConstraint operator&&(const L& left, const R& right) {
    return ComposedConstraint(std::make_shared<AndConstraint>(left.resolve(), right.resolve()));
}

template <ConstraintSource L, ConstraintSource R>
ComposedConstraint operator||(const L& left, const R& right) {
    return ComposedConstraint(std::make_shared<OrConstraint>(left.resolve(), right.resolve()));
}

template <ConstraintSource T>
ComposedConstraint operator!(const T& operand) {
    return ComposedConstraint(std::make_shared<NotConstraint>(operand.resolve()));
}

// Implementation of ConstraintExpression methods

inline FluentConstraint ConstraintExpression::append_leaf(std::shared_ptr<Constraint> leaf) const {
    builder_->append(ConstraintPtr(leaf));
    return FluentConstraint(builder_, std::move(leaf));
}

inline ResolvableConstraintExpression ConstraintExpression::property(std::string name) const {
    builder_->append(std::make_shared<PropertyOperator>(std::move(name)));
    return ResolvableConstraintExpression(builder_);
}

inline ResolvableConstraintExpression
ConstraintExpression::attribute(core::TypeDescriptor type) const {
    builder_->append(std::make_shared<AttributeOperator>(std::move(type)));
    return ResolvableConstraintExpression(builder_);
}

template <typename A>
ResolvableConstraintExpression ConstraintExpression::attribute() const {
    return attribute(core::type_of<A>());
}

template <typename T>
FluentConstraint ConstraintExpression::equal_to(const T& expected) const {
    return append_leaf(std::make_shared<EqualConstraint>(core::Value::from(expected)));
}

template <typename T>
FluentConstraint ConstraintExpression::equivalent_to(const T& expected) const {
    return append_leaf(std::make_shared<EquivalentConstraint>(core::Value::from(expected)));
}

template <typename T>
FluentConstraint ConstraintExpression::greater_than(const T& expected) const {
    return append_leaf(std::make_shared<GreaterThanConstraint>(core::Value::from(expected)));
}

template <typename T>
FluentConstraint ConstraintExpression::greater_than_or_equal_to(const T& expected) const {
    return append_leaf(
        std::make_shared<GreaterThanOrEqualConstraint>(core::Value::from(expected)));
}

template <typename T>
FluentConstraint ConstraintExpression::less_than(const T& expected) const {
    return append_leaf(std::make_shared<LessThanConstraint>(core::Value::from(expected)));
}

template <typename T>
FluentConstraint ConstraintExpression::less_than_or_equal_to(const T& expected) const {
    return append_leaf(std::make_shared<LessThanOrEqualConstraint>(core::Value::from(expected)));
}

template <typename... T>
FluentConstraint ConstraintExpression::any_of(const T&... expected) const {
    std::vector<core::Value> values{core::Value::from(expected)...};
    return append_leaf(std::make_shared<AnyOfConstraint>(std::move(values)));
}

template <typename T>
FluentConstraint ConstraintExpression::member(const T& expected) const {
    return append_leaf(std::make_shared<CollectionContainsConstraint>(core::Value::from(expected)));
}

template <typename T>
FluentConstraint ConstraintExpression::contain(const T& expected) const {
    return append_leaf(std::make_shared<ContainsConstraint>(core::Value::from(expected)));
}

inline FluentConstraint ConstraintExpression::null() const {
    return append_leaf(std::make_shared<NullConstraint>());
}

inline FluentConstraint ConstraintExpression::true_() const {
    return append_leaf(std::make_shared<TrueConstraint>());
}

inline FluentConstraint ConstraintExpression::false_() const {
    return append_leaf(std::make_shared<FalseConstraint>());
}

inline FluentConstraint ConstraintExpression::empty() const {
    return append_leaf(std::make_shared<EmptyConstraint>());
}

inline FluentConstraint ConstraintExpression::start_with(std::string expected) const {
    return append_leaf(std::make_shared<StartsWithConstraint>(std::move(expected)));
}

inline FluentConstraint ConstraintExpression::end_with(std::string expected) const {
    return append_leaf(std::make_shared<EndsWithConstraint>(std::move(expected)));
}

inline FluentConstraint ConstraintExpression::contain_substring(std::string expected) const {
    return append_leaf(std::make_shared<SubstringConstraint>(std::move(expected)));
}

inline FluentConstraint ConstraintExpression::match(std::string pattern) const {
    return append_leaf(std::make_shared<RegexConstraint>(std::move(pattern)));
}

inline FluentConstraint ConstraintExpression::same_path(std::string expected) const {
    return append_leaf(std::make_shared<SamePathConstraint>(std::move(expected)));
}

inline FluentConstraint ConstraintExpression::sub_path_of(std::string expected) const {
    return append_leaf(std::make_shared<SubPathConstraint>(std::move(expected)));
}

inline FluentConstraint ConstraintExpression::same_path_or_under(std::string expected) const {
    return append_leaf(std::make_shared<SamePathOrUnderConstraint>(std::move(expected)));
}

/// Leaf wrapping an externally built constraint; it takes no modifiers
class WrappedConstraint : public Constraint {
  public:
    explicit WrappedConstraint(ConstraintPtr inner)
        : Constraint("matches"), inner_(std::move(inner)) {
        if (!inner_) {
            throw core::ConfigurationError("matches requires a constraint");
        }
    }

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        return inner_->apply_to(actual, context);
    }

    std::string describe() const override { return inner_->description(); }

  private:
    ConstraintPtr inner_;
};

inline FluentConstraint ConstraintExpression::matches(ConstraintPtr constraint) const {
    return append_leaf(std::make_shared<WrappedConstraint>(std::move(constraint)));
}

/// Entry points for state and value expectations
struct Is {
    static ConstraintExpression not_() { return ConstraintExpression().not_(); }
    static ConstraintExpression all() { return ConstraintExpression().all(); }

    static FluentConstraint null() { return ConstraintExpression().null(); }
    static FluentConstraint true_() { return ConstraintExpression().true_(); }
    static FluentConstraint false_() { return ConstraintExpression().false_(); }
    static FluentConstraint empty() { return ConstraintExpression().empty(); }

    template <typename T>
    static FluentConstraint equal_to(const T& expected) {
        return ConstraintExpression().equal_to(expected);
    }

    template <typename T>
    static FluentConstraint equivalent_to(const T& expected) {
        return ConstraintExpression().equivalent_to(expected);
    }

    template <typename T>
    static FluentConstraint greater_than(const T& expected) {
        return ConstraintExpression().greater_than(expected);
    }

    template <typename T>
    static FluentConstraint greater_than_or_equal_to(const T& expected) {
        return ConstraintExpression().greater_than_or_equal_to(expected);
    }

    template <typename T>
    static FluentConstraint less_than(const T& expected) {
        return ConstraintExpression().less_than(expected);
    }

    template <typename T>
    static FluentConstraint less_than_or_equal_to(const T& expected) {
        return ConstraintExpression().less_than_or_equal_to(expected);
    }

    template <typename... T>
    static FluentConstraint any_of(const T&... expected) {
        return ConstraintExpression().any_of(expected...);
    }

    static FluentConstraint same_path(std::string expected) {
        return ConstraintExpression().same_path(std::move(expected));
    }

    static FluentConstraint sub_path_of(std::string expected) {
        return ConstraintExpression().sub_path_of(std::move(expected));
    }

    static FluentConstraint same_path_or_under(std::string expected) {
        return ConstraintExpression().same_path_or_under(std::move(expected));
    }
};

/// Entry points for collection and member expectations
struct Has {
    static ConstraintExpression all() { return ConstraintExpression().all(); }
    static ConstraintExpression some() { return ConstraintExpression().some(); }
    static ConstraintExpression none() { return ConstraintExpression().none(); }
    static ConstraintExpression no() { return ConstraintExpression().not_(); }

    static ResolvableConstraintExpression property(std::string name) {
        return ConstraintExpression().property(std::move(name));
    }

    template <typename A>
    static ResolvableConstraintExpression attribute() {
        return ConstraintExpression().attribute<A>();
    }

    static ResolvableConstraintExpression attribute(core::TypeDescriptor type) {
        return ConstraintExpression().attribute(std::move(type));
    }

    template <typename T>
    static FluentConstraint member(const T& expected) {
        return ConstraintExpression().member(expected);
    }
};

/// Entry points for string expectations
struct Does {
    static ConstraintExpression not_() { return ConstraintExpression().not_(); }

    static FluentConstraint start_with(std::string expected) {
        return ConstraintExpression().start_with(std::move(expected));
    }

    static FluentConstraint end_with(std::string expected) {
        return ConstraintExpression().end_with(std::move(expected));
    }

    template <typename T>
    static FluentConstraint contain(const T& expected) {
        return ConstraintExpression().contain(expected);
    }

    static FluentConstraint match(std::string pattern) {
        return ConstraintExpression().match(std::move(pattern));
    }
};

} // namespace assertlab::constraints
