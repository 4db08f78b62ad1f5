#pragma once

/// @file constraint.hpp
/// @brief Base types shared by every node of a constraint tree
///
/// A constraint is evaluated against one actual value and produces a ConstraintResult.
/// Evaluation never throws for an ordinary mismatch; only misuse (a configuration
/// error) unwinds. Descriptions are computed once on first access and cached.

#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <assertlab/constraints/message_writer.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/tolerance.hpp>
#include <assertlab/core/value.hpp>
#include <assertlab/core/value_format.hpp>

namespace assertlab::constraints {

/// Settings handed down from the evaluating execution context
struct EvaluationContext {
    core::Tolerance default_floating_point_tolerance = core::Tolerance::default_tolerance();
};

enum class ToleranceUnit { percent, ulps, nanoseconds, microseconds, milliseconds, seconds, minutes };

inline const char* to_string(ToleranceUnit unit) {
    switch (unit) {
    case ToleranceUnit::percent:
        return "percent";
    case ToleranceUnit::ulps:
        return "ulps";
    case ToleranceUnit::nanoseconds:
        return "nanoseconds";
    case ToleranceUnit::microseconds:
        return "microseconds";
    case ToleranceUnit::milliseconds:
        return "milliseconds";
    case ToleranceUnit::seconds:
        return "seconds";
    case ToleranceUnit::minutes:
        return "minutes";
    }
    return "unknown";
}

namespace modifiers {

struct Within {
    core::Tolerance tolerance;
};

struct Unit {
    ToleranceUnit unit;
};

struct IgnoreCase {};
struct AsCollection {};
struct InAnyOrder {};

} // namespace modifiers

/// Fluent modifier applied to the most recently added leaf
using Modifier = std::variant<modifiers::Within, modifiers::Unit, modifiers::IgnoreCase,
                              modifiers::AsCollection, modifiers::InAnyOrder>;

inline std::string to_string(const Modifier& modifier) {
    if (const auto* unit = std::get_if<modifiers::Unit>(&modifier)) {
        return to_string(unit->unit);
    }
    if (std::holds_alternative<modifiers::Within>(modifier)) {
        return "within";
    }
    if (std::holds_alternative<modifiers::IgnoreCase>(modifier)) {
        return "ignore_case";
    }
    if (std::holds_alternative<modifiers::AsCollection>(modifier)) {
        return "as_collection";
    }
    return "in_any_order";
}

class ConstraintResult;
class Constraint;

using ConstraintPtr = std::shared_ptr<const Constraint>;
using ResultPtr = std::unique_ptr<ConstraintResult>;

/// Abstract node of a constraint tree
///
/// Constraints are always owned through shared pointers; results keep the constraint
/// that produced them alive.
class Constraint : public std::enable_shared_from_this<Constraint> {
  public:
    explicit Constraint(std::string display_name) : display_name_(std::move(display_name)) {}
    virtual ~Constraint() = default;

    Constraint(const Constraint&) = delete;
    Constraint& operator=(const Constraint&) = delete;

    /// Short name used in diagnostics, e.g. "equal"
    const std::string& display_name() const { return display_name_; }

    /// Human-readable expectation; built on first use and cached
    const std::string& description() const {
        std::call_once(description_once_, [this] {
            description_ = describe();
            described_.store(true, std::memory_order_release);
        });
        return description_;
    }

    ResultPtr apply_to(const core::Value& actual,
                       const EvaluationContext& context = EvaluationContext{}) const {
        return evaluate(actual, context);
    }

    template <typename T>
    ResultPtr apply_to_value(const T& actual,
                             const EvaluationContext& context = EvaluationContext{}) const {
        return evaluate(core::Value::from(actual), context);
    }

    /// Apply a fluent modifier through modify() while the description is still open
    ///
    /// @throws core::ConfigurationError once the description has been computed
    void apply_modifier(const Modifier& modifier) {
        if (described_.load(std::memory_order_acquire)) {
            throw core::ConfigurationError(
                std::format("Cannot apply {} to the {} constraint after it has been described",
                            to_string(modifier), display_name_));
        }
        modify(modifier);
    }

    /// Apply a fluent modifier; leaves override the modifiers they understand
    ///
    /// @throws core::ConfigurationError for a modifier this constraint does not support
    virtual void modify(const Modifier& modifier) {
        throw core::ConfigurationError(std::format("The {} constraint does not support {}",
                                                   display_name_, to_string(modifier)));
    }

  protected:
    virtual ResultPtr evaluate(const core::Value& actual,
                               const EvaluationContext& context) const = 0;

    virtual std::string describe() const = 0;

    ConstraintPtr self() const { return shared_from_this(); }

    static std::string format(const core::Value& value) { return core::format_value(value); }

  private:
    std::string display_name_;
    mutable std::once_flag description_once_;
    mutable std::string description_;
    mutable std::atomic<bool> described_{false};
};

/// Outcome of applying a constraint to one actual value
class ConstraintResult {
  public:
    ConstraintResult(ConstraintPtr constraint, core::Value actual_value, bool success)
        : constraint_(std::move(constraint)), actual_value_(std::move(actual_value)),
          success_(success) {}

    virtual ~ConstraintResult() = default;

    bool is_success() const { return success_; }
    const core::Value& actual_value() const { return actual_value_; }
    const Constraint& constraint() const { return *constraint_; }
    const std::string& name() const { return constraint_->display_name(); }
    const std::string& description() const { return constraint_->description(); }

    /// Expected and actual lines followed by any constraint-specific detail
    void write_message_to(MessageWriter& writer) const {
        writer.write_expected_line(description());
        write_actual_value_to(writer);
        write_additional_lines_to(writer);
    }

    virtual void write_actual_value_to(MessageWriter& writer) const {
        writer.write_actual_line(actual_value_);
    }

    virtual void write_additional_lines_to(MessageWriter&) const {}

  private:
    ConstraintPtr constraint_;
    core::Value actual_value_;
    bool success_;
};

/// Items of a collection-shaped value, or nullopt for anything else
///
/// Dictionaries yield their entries as pairs; structurally equatable values yield
/// their elements when they expose them.
inline std::optional<std::vector<core::Value>> collection_items(const core::Value& value) {
    switch (value.kind()) {
    case core::ValueKind::sequence:
        return value.as_sequence().items;
    case core::ValueKind::dictionary: {
        std::vector<core::Value> entries;
        for (const auto& [key, entry] : value.as_dictionary().entries) {
            entries.push_back(core::Value::pair(key, entry));
        }
        return entries;
    }
    case core::ValueKind::structural:
        return value.as_structural().elements();
    default:
        return std::nullopt;
    }
}

} // namespace assertlab::constraints
