#pragma once

/// @file operators.hpp
/// @brief Parse-time operators and the precedence-climbing constraint builder
///
/// A fluent expression is a left-to-right stream of constraints and operators. Each
/// operator carries a left and a right precedence; a smaller number binds tighter.
/// Prefix operators use 1, AND 2 and OR 3, so `a and b or c` groups as `(a and b) or c`.
/// Collection operators bind with a right precedence of 10, so binary operators that
/// follow them stay inside: `all a and b` applies `a and b` to every item.

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <assertlab/constraints/binary.hpp>
#include <assertlab/constraints/constraint.hpp>
#include <assertlab/constraints/prefix.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::constraints {

using ConstraintStack = std::vector<ConstraintPtr>;

class ConstraintOperator {
  public:
    virtual ~ConstraintOperator() = default;

    int left_precedence() const { return left_precedence_; }
    int right_precedence() const { return right_precedence_; }

    /// Pop operands from the stack and push the combined constraint
    virtual void reduce(ConstraintStack& stack) const = 0;

  protected:
    ConstraintOperator(int left_precedence, int right_precedence)
        : left_precedence_(left_precedence), right_precedence_(right_precedence) {}

    static ConstraintPtr pop(ConstraintStack& stack) {
        if (stack.empty()) {
            throw core::ConfigurationError("Constraint expression is missing an operand");
        }
        ConstraintPtr top = std::move(stack.back());
        stack.pop_back();
        return top;
    }

  private:
    int left_precedence_;
    int right_precedence_;
};

class PrefixOperator : public ConstraintOperator {
  public:
    void reduce(ConstraintStack& stack) const override { stack.push_back(apply(pop(stack))); }

    virtual ConstraintPtr apply(ConstraintPtr base) const = 0;

  protected:
    PrefixOperator() : ConstraintOperator(1, 1) {}
    PrefixOperator(int left_precedence, int right_precedence)
        : ConstraintOperator(left_precedence, right_precedence) {}
};

/// Item quantifier; everything after it up to the end of the expression is its operand
class CollectionOperator : public PrefixOperator {
  protected:
    CollectionOperator() : PrefixOperator(1, 10) {}
};

/// Prefix operator that stands for a complete constraint when nothing follows it
class SelfResolvingOperator : public PrefixOperator {
  public:
    virtual ConstraintPtr resolve_alone() const = 0;
};

class BinaryOperator : public ConstraintOperator {
  public:
    void reduce(ConstraintStack& stack) const override {
        ConstraintPtr right = pop(stack);
        ConstraintPtr left = pop(stack);
        stack.push_back(apply(std::move(left), std::move(right)));
    }

    virtual ConstraintPtr apply(ConstraintPtr left, ConstraintPtr right) const = 0;

  protected:
    explicit BinaryOperator(int precedence) : ConstraintOperator(precedence, precedence) {}
};

class NotOperator : public PrefixOperator {
  public:
    ConstraintPtr apply(ConstraintPtr base) const override {
        return std::make_shared<NotConstraint>(std::move(base));
    }
};

class AllOperator : public CollectionOperator {
  public:
    ConstraintPtr apply(ConstraintPtr base) const override {
        return std::make_shared<AllItemsConstraint>(std::move(base));
    }
};

class SomeOperator : public CollectionOperator {
  public:
    ConstraintPtr apply(ConstraintPtr base) const override {
        return std::make_shared<SomeItemsConstraint>(std::move(base));
    }
};

class NoneOperator : public CollectionOperator {
  public:
    ConstraintPtr apply(ConstraintPtr base) const override {
        return std::make_shared<NoItemConstraint>(std::move(base));
    }
};

class PropertyOperator : public SelfResolvingOperator {
  public:
    explicit PropertyOperator(std::string name) : name_(std::move(name)) {}

    ConstraintPtr apply(ConstraintPtr base) const override {
        return std::make_shared<PropertyConstraint>(name_, std::move(base));
    }

    ConstraintPtr resolve_alone() const override {
        return std::make_shared<PropertyExistsConstraint>(name_);
    }

  private:
    std::string name_;
};

class AttributeOperator : public SelfResolvingOperator {
  public:
    /// @throws core::ConfigurationError if `type` is not an attribute type
    explicit AttributeOperator(core::TypeDescriptor type) : type_(std::move(type)) {
        detail::require_attribute_type(type_);
    }

    ConstraintPtr apply(ConstraintPtr base) const override {
        return std::make_shared<AttributeConstraint>(type_, std::move(base));
    }

    ConstraintPtr resolve_alone() const override {
        return std::make_shared<AttributeExistsConstraint>(type_);
    }

  private:
    core::TypeDescriptor type_;
};

class AndOperator : public BinaryOperator {
  public:
    AndOperator() : BinaryOperator(2) {}

    ConstraintPtr apply(ConstraintPtr left, ConstraintPtr right) const override {
        return std::make_shared<AndConstraint>(std::move(left), std::move(right));
    }
};

class OrOperator : public BinaryOperator {
  public:
    OrOperator() : BinaryOperator(3) {}

    ConstraintPtr apply(ConstraintPtr left, ConstraintPtr right) const override {
        return std::make_shared<OrConstraint>(std::move(left), std::move(right));
    }
};

/// Operator-precedence builder behind the fluent syntax
///
/// Operands and operators are appended in source order. A binary operator first
/// reduces every pending operator that binds at least as tightly, which makes equal
/// precedence left-associative. Prefix operators never reduce: their operand has not
/// been seen yet. Resolution is performed once and cached.
class ConstraintBuilder {
  public:
    void append(std::shared_ptr<const ConstraintOperator> op) {
        require_open();
        if (auto prefix = std::dynamic_pointer_cast<const PrefixOperator>(op)) {
            if (last_ == Last::constraint) {
                throw core::ConfigurationError(
                    "A prefix operator may not follow a complete constraint");
            }
            ops_.push_back(std::move(prefix));
            last_ = Last::op;
            return;
        }
        resolve_trailing_operator();
        if (last_ != Last::constraint) {
            throw core::ConfigurationError("A binary operator requires a left operand");
        }
        while (!ops_.empty() && ops_.back()->right_precedence() <= op->left_precedence()) {
            reduce_top();
        }
        ops_.push_back(std::move(op));
        last_ = Last::op;
    }

    void append(ConstraintPtr constraint) {
        require_open();
        if (last_ == Last::constraint) {
            throw core::ConfigurationError("Two constraints must be joined by an operator");
        }
        constraints_.push_back(std::move(constraint));
        last_ = Last::constraint;
    }

    /// True when the expression so far forms a complete constraint
    bool is_resolvable() const {
        if (resolved_) {
            return true;
        }
        if (last_ == Last::constraint) {
            return true;
        }
        return last_ == Last::op &&
               std::dynamic_pointer_cast<const SelfResolvingOperator>(ops_.back()) != nullptr;
    }

    ConstraintPtr resolve() {
        if (resolved_) {
            return *resolved_;
        }
        if (!is_resolvable()) {
            throw core::ConfigurationError("A partial constraint expression may not be resolved");
        }
        resolve_trailing_operator();
        while (!ops_.empty()) {
            reduce_top();
        }
        if (constraints_.size() != 1) {
            throw core::ConfigurationError("Constraint expression did not reduce to one constraint");
        }
        resolved_ = constraints_.back();
        return *resolved_;
    }

  private:
    enum class Last { nothing, constraint, op };

    void require_open() const {
        if (resolved_) {
            throw core::ConfigurationError("A resolved constraint expression cannot be extended");
        }
    }

    /// A self-resolving operator with nothing after it stands for its own constraint
    void resolve_trailing_operator() {
        if (last_ != Last::op || ops_.empty()) {
            return;
        }
        if (auto self_resolving =
                std::dynamic_pointer_cast<const SelfResolvingOperator>(ops_.back())) {
            ops_.pop_back();
            constraints_.push_back(self_resolving->resolve_alone());
            last_ = Last::constraint;
        }
    }

    void reduce_top() {
        auto op = std::move(ops_.back());
        ops_.pop_back();
        op->reduce(constraints_);
    }

    std::vector<std::shared_ptr<const ConstraintOperator>> ops_;
    ConstraintStack constraints_;
    Last last_ = Last::nothing;
    std::optional<ConstraintPtr> resolved_;
};

} // namespace assertlab::constraints
