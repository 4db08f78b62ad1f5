#pragma once

/// @file string.hpp
/// @brief String leaves (prefix, suffix, substring, regex) and the dispatching contains

#include <format>
#include <memory>
#include <regex>
#include <string>
#include <utility>

#include <assertlab/comparers/equality_comparer.hpp>
#include <assertlab/constraints/constraint.hpp>
#include <assertlab/constraints/equality.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::constraints {

/// Base for leaves that test the actual string against an expected fragment
///
/// A null actual value fails; any other non-string actual value is a configuration
/// error.
class StringConstraint : public Constraint {
  public:
    const std::string& expected() const { return expected_; }
    bool case_insensitive() const { return case_insensitive_; }

    void modify(const Modifier& modifier) override {
        if (!std::holds_alternative<modifiers::IgnoreCase>(modifier)) {
            Constraint::modify(modifier);
        }
        case_insensitive_ = true;
        on_ignore_case();
    }

  protected:
    StringConstraint(std::string name, std::string phrase, std::string expected)
        : Constraint(std::move(name)), phrase_(std::move(phrase)), expected_(std::move(expected)) {}

    virtual bool matches(const std::string& actual) const = 0;

    virtual void on_ignore_case() {}

    ResultPtr evaluate(const core::Value& actual, const EvaluationContext&) const override {
        if (actual.is_null()) {
            return std::make_unique<ConstraintResult>(self(), actual, false);
        }
        if (!actual.is_string()) {
            throw core::ConfigurationError(std::format(
                "The actual value must be a string, not {}", core::to_string(actual.kind())));
        }
        return std::make_unique<ConstraintResult>(self(), actual, matches(actual.as_string()));
    }

    std::string describe() const override {
        std::string text = phrase_ + " " + format(core::Value(expected_));
        return case_insensitive_ ? text + ", ignoring case" : text;
    }

    /// Pair of (expected, actual) folded to lower case when case is ignored
    std::pair<std::string, std::string> operands(const std::string& actual) const {
        if (case_insensitive_) {
            return {comparers::detail::lowered(expected_), comparers::detail::lowered(actual)};
        }
        return {expected_, actual};
    }

  private:
    std::string phrase_;
    std::string expected_;
    bool case_insensitive_ = false;
};

class StartsWithConstraint : public StringConstraint {
  public:
    explicit StartsWithConstraint(std::string expected)
        : StringConstraint("starts with", "String starting with", std::move(expected)) {}

  protected:
    bool matches(const std::string& actual) const override {
        auto [prefix, text] = operands(actual);
        return text.starts_with(prefix);
    }
};

class EndsWithConstraint : public StringConstraint {
  public:
    explicit EndsWithConstraint(std::string expected)
        : StringConstraint("ends with", "String ending with", std::move(expected)) {}

  protected:
    bool matches(const std::string& actual) const override {
        auto [suffix, text] = operands(actual);
        return text.ends_with(suffix);
    }
};

class SubstringConstraint : public StringConstraint {
  public:
    explicit SubstringConstraint(std::string expected)
        : StringConstraint("substring", "String containing", std::move(expected)) {}

  protected:
    bool matches(const std::string& actual) const override {
        auto [fragment, text] = operands(actual);
        return text.find(fragment) != std::string::npos;
    }
};

/// Regular expression search (ECMAScript grammar)
class RegexConstraint : public StringConstraint {
  public:
    explicit RegexConstraint(std::string pattern)
        : StringConstraint("regex", "String matching", std::move(pattern)),
          regex_(compile(expected(), false)) {}

  protected:
    bool matches(const std::string& actual) const override {
        return std::regex_search(actual, regex_);
    }

    void on_ignore_case() override { regex_ = compile(expected(), true); }

  private:
    static std::regex compile(const std::string& pattern, bool ignore_case) {
        auto flags = std::regex::ECMAScript;
        if (ignore_case) {
            flags |= std::regex::icase;
        }
        try {
            return std::regex(pattern, flags);
        } catch (const std::regex_error& e) {
            throw core::ConfigurationError(
                std::format("Invalid regular expression \"{}\": {}", pattern, e.what()));
        }
    }

    std::regex regex_;
};

/// Substring test for string actuals, membership test for collections
class ContainsConstraint : public Constraint {
  public:
    explicit ContainsConstraint(core::Value expected)
        : Constraint("contains"), expected_(expected),
          collection_(std::make_shared<CollectionContainsConstraint>(expected)) {
        if (expected.is_string()) {
            substring_ = std::make_shared<SubstringConstraint>(expected.as_string());
        }
    }

    void modify(const Modifier& modifier) override {
        collection_->modify(modifier);
        if (substring_ && std::holds_alternative<modifiers::IgnoreCase>(modifier)) {
            substring_->modify(modifier);
        }
    }

  protected:
    ResultPtr evaluate(const core::Value& actual,
                       const EvaluationContext& context) const override {
        if (actual.is_string() && substring_) {
            return substring_->apply_to(actual, context);
        }
        return collection_->apply_to(actual, context);
    }

    std::string describe() const override { return "containing " + format(expected_); }

  private:
    core::Value expected_;
    std::shared_ptr<CollectionContainsConstraint> collection_;
    std::shared_ptr<SubstringConstraint> substring_;
};

} // namespace assertlab::constraints
