#pragma once

/// @file path.hpp
/// @brief File-system path leaves compared after lexical canonicalization

#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <assertlab/comparers/equality_comparer.hpp>
#include <assertlab/constraints/constraint.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::constraints {

namespace detail {

/// Lexically normalize a path: both separators accepted, "." and ".." folded,
/// repeated and trailing separators dropped. The file system is never consulted.
inline std::string canonicalize(std::string_view path) {
    bool rooted = !path.empty() && (path.front() == '/' || path.front() == '\\');
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find_first_of("/\\", start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        std::string_view part = path.substr(start, end - start);
        if (part == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!rooted) {
                parts.push_back(part);
            }
        } else if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
        start = end + 1;
    }

    std::string result = rooted ? "/" : "";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += parts[i];
    }
    return result;
}

/// True when `child` lies strictly below `parent`; both already canonical
inline bool is_sub_path(const std::string& parent, const std::string& child) {
    if (child.size() <= parent.size() || !child.starts_with(parent)) {
        return false;
    }
    return parent.ends_with('/') || child[parent.size()] == '/';
}

} // namespace detail

class PathConstraint : public Constraint {
  public:
    void modify(const Modifier& modifier) override {
        if (!std::holds_alternative<modifiers::IgnoreCase>(modifier)) {
            Constraint::modify(modifier);
        }
        case_insensitive_ = true;
    }

  protected:
    PathConstraint(std::string name, std::string phrase, std::string expected)
        : Constraint(std::move(name)), phrase_(std::move(phrase)), expected_(std::move(expected)) {}

    /// Both arguments are canonical and case-folded when case is ignored
    virtual bool matches(const std::string& expected, const std::string& actual) const = 0;

    ResultPtr evaluate(const core::Value& actual, const EvaluationContext&) const override {
        if (actual.is_null()) {
            return std::make_unique<ConstraintResult>(self(), actual, false);
        }
        if (!actual.is_string()) {
            throw core::ConfigurationError(std::format(
                "The actual value must be a path string, not {}", core::to_string(actual.kind())));
        }
        std::string expected = detail::canonicalize(expected_);
        std::string candidate = detail::canonicalize(actual.as_string());
        if (case_insensitive_) {
            expected = comparers::detail::lowered(expected);
            candidate = comparers::detail::lowered(candidate);
        }
        return std::make_unique<ConstraintResult>(self(), actual, matches(expected, candidate));
    }

    std::string describe() const override {
        std::string text = phrase_ + " " + format(core::Value(expected_));
        return case_insensitive_ ? text + ", ignoring case" : text;
    }

  private:
    std::string phrase_;
    std::string expected_;
    bool case_insensitive_ = false;
};

class SamePathConstraint : public PathConstraint {
  public:
    explicit SamePathConstraint(std::string expected)
        : PathConstraint("same path", "Path matching", std::move(expected)) {}

  protected:
    bool matches(const std::string& expected, const std::string& actual) const override {
        return expected == actual;
    }
};

class SubPathConstraint : public PathConstraint {
  public:
    explicit SubPathConstraint(std::string expected)
        : PathConstraint("sub path", "Subpath of", std::move(expected)) {}

  protected:
    bool matches(const std::string& expected, const std::string& actual) const override {
        return detail::is_sub_path(expected, actual);
    }
};

class SamePathOrUnderConstraint : public PathConstraint {
  public:
    explicit SamePathOrUnderConstraint(std::string expected)
        : PathConstraint("same path or under", "Path under or matching", std::move(expected)) {}

  protected:
    bool matches(const std::string& expected, const std::string& actual) const override {
        return expected == actual || detail::is_sub_path(expected, actual);
    }
};

} // namespace assertlab::constraints
