#pragma once

/// @file equality_comparer.hpp
/// @brief Deep, cycle-safe structural equality driven by an ordered comparer chain
///
/// The chain is fixed: numerics, primitives, strings, time spans, tuples, pairs,
/// structurally equatable values, dictionaries, sequences and finally records compared
/// member by member. The first entry that does not abstain decides; if every entry
/// abstains the values are unequal.

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <assertlab/comparers/chain_comparer.hpp>
#include <assertlab/comparers/comparison_state.hpp>
#include <assertlab/comparers/numerics.hpp>
#include <assertlab/core/errors.hpp>
#include <assertlab/core/tolerance.hpp>
#include <assertlab/core/value.hpp>

namespace assertlab::comparers {

/// Position at which two collections were found to differ
struct FailurePoint {
    std::size_t position = 0;
    std::optional<core::Value> expected;
    std::optional<core::Value> actual;
};

/// Switches that change how the chain treats collections and strings
struct EqualityOptions {
    bool ignore_case = false;
    bool compare_as_collection = false;
    bool in_any_order = false;
};

class EqualityComparer {
  public:
    explicit EqualityComparer(
        EqualityOptions options = {},
        core::Tolerance default_floating_point_tolerance = core::Tolerance::default_tolerance());

    EqualityComparer(const EqualityComparer&) = delete;
    EqualityComparer& operator=(const EqualityComparer&) = delete;

    const EqualityOptions& options() const { return options_; }

    const core::Tolerance& default_floating_point_tolerance() const {
        return default_floating_point_tolerance_;
    }

    /// Outermost first, filled in while a failed comparison unwinds
    const std::vector<FailurePoint>& failure_points() const { return failure_points_; }

    void record_failure_point(FailurePoint point) {
        failure_points_.insert(failure_points_.begin(), std::move(point));
    }

    /// Top-level comparison; `x` is the expected operand
    bool are_equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance) {
        failure_points_.clear();
        return are_equal(x, y, tolerance, ComparisonState(true));
    }

    bool are_equal(const core::Value& x, const core::Value& y) {
        core::Tolerance tolerance = core::Tolerance::default_tolerance();
        return are_equal(x, y, tolerance);
    }

    /// Recursive entry used by chain members
    bool are_equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                   ComparisonState state);

  private:
    EqualityOptions options_;
    core::Tolerance default_floating_point_tolerance_;
    std::vector<FailurePoint> failure_points_;
    std::vector<std::unique_ptr<ChainComparer>> chain_;
};

namespace detail {

inline void reject_tolerance(const core::Tolerance& tolerance, const core::Value& value) {
    if (tolerance.mode() != core::ToleranceMode::none) {
        throw core::ToleranceError(std::format("A {} tolerance cannot be applied to a {} value",
                                               core::to_string(tolerance.mode()),
                                               core::to_string(value.kind())));
    }
}

inline std::string lowered(const std::string& text) {
    std::string result = text;
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace detail

class NumericsComparer : public ChainComparer {
  public:
    explicit NumericsComparer(EqualityComparer& owner) : owner_(owner) {}

    Decision equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                   ComparisonState) override {
        if (!x.is_numeric() || !y.is_numeric()) {
            return abstain;
        }
        if (tolerance.is_unset_or_default() && (x.is_floating() || y.is_floating()) &&
            applies_to(owner_.default_floating_point_tolerance(), x)) {
            tolerance = owner_.default_floating_point_tolerance();
        }
        return numerics::are_equal(x, y, tolerance);
    }

    const char* name() const override { return "numerics"; }

  private:
    /// A context default replaces an unset tolerance only if it fits the expected value
    static bool applies_to(const core::Tolerance& fallback, const core::Value& expected) {
        switch (fallback.mode()) {
        case core::ToleranceMode::linear:
        case core::ToleranceMode::percent:
            return true;
        case core::ToleranceMode::ulps:
            return expected.is_floating();
        default:
            return false;
        }
    }

    EqualityComparer& owner_;
};

class PrimitivesComparer : public ChainComparer {
  public:
    Decision equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                   ComparisonState) override {
        if (x.kind() != core::ValueKind::boolean || y.kind() != core::ValueKind::boolean) {
            return abstain;
        }
        detail::reject_tolerance(tolerance, x);
        return x.as_bool() == y.as_bool();
    }

    const char* name() const override { return "primitives"; }
};

class StringsComparer : public ChainComparer {
  public:
    explicit StringsComparer(EqualityComparer& owner) : owner_(owner) {}

    Decision equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                   ComparisonState) override {
        if (!x.is_string() || !y.is_string()) {
            return abstain;
        }
        detail::reject_tolerance(tolerance, x);
        if (owner_.options().ignore_case) {
            return detail::lowered(x.as_string()) == detail::lowered(y.as_string());
        }
        return x.as_string() == y.as_string();
    }

    const char* name() const override { return "strings"; }

  private:
    EqualityComparer& owner_;
};

/// Durations; a time-span context default stands in for an unset tolerance
class TimeSpanComparer : public ChainComparer {
  public:
    explicit TimeSpanComparer(EqualityComparer& owner) : owner_(owner) {}

    Decision equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                   ComparisonState) override {
        if (!x.is_duration() || !y.is_duration()) {
            return abstain;
        }
        if (tolerance.is_unset_or_default() &&
            owner_.default_floating_point_tolerance().mode() == core::ToleranceMode::time_span) {
            tolerance = owner_.default_floating_point_tolerance();
        }
        if (tolerance.mode() == core::ToleranceMode::none) {
            return x.as_duration() == y.as_duration();
        }
        core::Range range = tolerance.apply_to_value(x);
        return range.lower_bound.as_duration() <= y.as_duration() &&
               y.as_duration() <= range.upper_bound.as_duration();
    }

    const char* name() const override { return "time spans"; }

  private:
    EqualityComparer& owner_;
};

/// Positional comparison shared by both tuple flavors
class TupleComparerBase : public ChainComparer {
  public:
    explicit TupleComparerBase(EqualityComparer& owner) : owner_(owner) {}

    Decision equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                   ComparisonState state) override {
        if (x.kind() != core::ValueKind::tuple || y.kind() != core::ValueKind::tuple) {
            return abstain;
        }
        const auto& left = x.as_tuple();
        const auto& right = y.as_tuple();
        if (left.flavor != flavor() || right.flavor != flavor()) {
            return abstain;
        }
        if (left.items.size() != right.items.size()) {
            return false;
        }
        ComparisonState nested = state.push_comparison(x, y);
        for (std::size_t i = 0; i < left.items.size(); ++i) {
            core::Tolerance item_tolerance = tolerance;
            if (!owner_.are_equal(left.items[i], right.items[i], item_tolerance, nested)) {
                return false;
            }
        }
        return true;
    }

  protected:
    virtual core::TupleFlavor flavor() const = 0;

  private:
    EqualityComparer& owner_;
};

class TupleComparer : public TupleComparerBase {
  public:
    using TupleComparerBase::TupleComparerBase;
    const char* name() const override { return "tuples"; }

  protected:
    core::TupleFlavor flavor() const override { return core::TupleFlavor::tuple; }
};

class PairComparer : public TupleComparerBase {
  public:
    using TupleComparerBase::TupleComparerBase;
    const char* name() const override { return "pairs"; }

  protected:
    core::TupleFlavor flavor() const override { return core::TupleFlavor::pair; }
};

/// Values implementing StructurallyEquatable decide for themselves
///
/// Both directions are asked and either agreeing is enough: two implementations are
/// not required to know about each other symmetrically.
class StructuralComparer : public ChainComparer {
  public:
    explicit StructuralComparer(EqualityComparer& owner) : owner_(owner) {}

    Decision equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                   ComparisonState state) override {
        if (owner_.options().compare_as_collection && state.top_level_comparison()) {
            return abstain;
        }
        if (x.kind() != core::ValueKind::structural || y.kind() != core::ValueKind::structural) {
            return abstain;
        }
        Elements elements(owner_, tolerance, state.push_comparison(x, y));
        bool x_result = x.as_structural().structurally_equals(y, elements);
        bool y_result = y.as_structural().structurally_equals(x, elements);
        tolerance = elements.tolerance();
        return x_result || y_result;
    }

    const char* name() const override { return "structural"; }

  private:
    class Elements : public core::ElementComparer {
      public:
        Elements(EqualityComparer& owner, core::Tolerance tolerance, ComparisonState state)
            : owner_(owner), tolerance_(std::move(tolerance)), state_(std::move(state)) {}

        bool equal(const core::Value& x, const core::Value& y) override {
            return owner_.are_equal(x, y, tolerance_, state_);
        }

        const core::Tolerance& tolerance() const { return tolerance_; }

      private:
        EqualityComparer& owner_;
        core::Tolerance tolerance_;
        ComparisonState state_;
    };

    EqualityComparer& owner_;
};

class DictionariesComparer : public ChainComparer {
  public:
    explicit DictionariesComparer(EqualityComparer& owner) : owner_(owner) {}

    Decision equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                   ComparisonState state) override {
        if (x.kind() != core::ValueKind::dictionary || y.kind() != core::ValueKind::dictionary) {
            return abstain;
        }
        const auto& left = x.as_dictionary().entries;
        const auto& right = y.as_dictionary().entries;
        if (left.size() != right.size()) {
            return false;
        }
        ComparisonState nested = state.push_comparison(x, y);
        for (const auto& [key, value] : left) {
            const core::Value* match = nullptr;
            for (const auto& [other_key, other_value] : right) {
                core::Tolerance key_tolerance = core::Tolerance::default_tolerance();
                if (owner_.are_equal(key, other_key, key_tolerance, nested)) {
                    match = &other_value;
                    break;
                }
            }
            core::Tolerance value_tolerance = tolerance;
            if (match == nullptr || !owner_.are_equal(value, *match, value_tolerance, nested)) {
                return false;
            }
        }
        return true;
    }

    const char* name() const override { return "dictionaries"; }

  private:
    EqualityComparer& owner_;
};

/// Element-wise comparison of sequences
///
/// Ordered unless the comparer asks for any order or either side is an unordered
/// collection. Unordered comparison looks for a one-to-one pairing of equal items and
/// compares each pair at most once.
class EnumerablesComparer : public ChainComparer {
  public:
    explicit EnumerablesComparer(EqualityComparer& owner) : owner_(owner) {}

    Decision equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                   ComparisonState state) override {
        auto left = items_of(x, state);
        auto right = items_of(y, state);
        if (!left || !right) {
            return abstain;
        }
        ComparisonState nested = state.push_comparison(x, y);
        bool unordered = owner_.options().in_any_order || is_unordered(x) || is_unordered(y);
        if (left->size() != right->size()) {
            if (!unordered) {
                std::size_t position = std::min(left->size(), right->size());
                FailurePoint point{position, std::nullopt, std::nullopt};
                if (position < left->size()) {
                    point.expected = (*left)[position];
                }
                if (position < right->size()) {
                    point.actual = (*right)[position];
                }
                owner_.record_failure_point(std::move(point));
            }
            return false;
        }
        return unordered ? equal_in_any_order(*left, *right, tolerance, nested)
                         : equal_in_order(*left, *right, tolerance, nested);
    }

    const char* name() const override { return "enumerables"; }

  private:
    std::optional<std::vector<core::Value>> items_of(const core::Value& value,
                                                     const ComparisonState& state) const {
        if (value.kind() == core::ValueKind::sequence) {
            return value.as_sequence().items;
        }
        if (value.kind() == core::ValueKind::structural && owner_.options().compare_as_collection &&
            state.top_level_comparison()) {
            return value.as_structural().elements();
        }
        return std::nullopt;
    }

    static bool is_unordered(const core::Value& value) {
        return value.kind() == core::ValueKind::sequence &&
               value.as_sequence().order == core::SequenceOrder::unordered;
    }

    bool equal_in_order(const std::vector<core::Value>& left, const std::vector<core::Value>& right,
                        const core::Tolerance& tolerance, const ComparisonState& state) {
        for (std::size_t i = 0; i < left.size(); ++i) {
            core::Tolerance item_tolerance = tolerance;
            if (!owner_.are_equal(left[i], right[i], item_tolerance, state)) {
                owner_.record_failure_point({i, left[i], right[i]});
                return false;
            }
        }
        return true;
    }

    /// Equal when every actual item can be paired with a distinct equal expected item.
    /// Pairs are found by augmenting paths, so an early match can be moved aside when a
    /// later item has no other partner.
    bool equal_in_any_order(const std::vector<core::Value>& expected,
                            const std::vector<core::Value>& actual,
                            const core::Tolerance& tolerance, const ComparisonState& state) {
        std::vector<std::vector<std::optional<bool>>> pairs(
            actual.size(), std::vector<std::optional<bool>>(expected.size()));
        auto pair_equal = [&](std::size_t a, std::size_t e) {
            auto& cached = pairs[a][e];
            if (!cached) {
                core::Tolerance item_tolerance = tolerance;
                cached = owner_.are_equal(expected[e], actual[a], item_tolerance, state);
            }
            return *cached;
        };

        std::vector<std::optional<std::size_t>> partner(expected.size());
        std::vector<bool> visited;
        std::function<bool(std::size_t)> augment = [&](std::size_t a) {
            for (std::size_t e = 0; e < expected.size(); ++e) {
                if (visited[e] || !pair_equal(a, e)) {
                    continue;
                }
                visited[e] = true;
                if (!partner[e] || augment(*partner[e])) {
                    partner[e] = a;
                    return true;
                }
            }
            return false;
        };

        for (std::size_t a = 0; a < actual.size(); ++a) {
            visited.assign(expected.size(), false);
            if (!augment(a)) {
                return false;
            }
        }
        return true;
    }

    EqualityComparer& owner_;
};

/// Member-by-member fallback for records of the same type
class RecordsComparer : public ChainComparer {
  public:
    explicit RecordsComparer(EqualityComparer& owner) : owner_(owner) {}

    Decision equal(const core::Value& x, const core::Value& y, core::Tolerance& tolerance,
                   ComparisonState state) override {
        if (x.kind() != core::ValueKind::record || y.kind() != core::ValueKind::record) {
            return abstain;
        }
        const auto& left = x.as_record();
        const auto& right = y.as_record();
        if (left.type != right.type || left.members.size() != right.members.size()) {
            return false;
        }
        ComparisonState nested = state.push_comparison(x, y);
        for (std::size_t i = 0; i < left.members.size(); ++i) {
            if (left.members[i].first != right.members[i].first) {
                return false;
            }
            core::Tolerance member_tolerance = tolerance;
            if (!owner_.are_equal(left.members[i].second, right.members[i].second,
                                  member_tolerance, nested)) {
                return false;
            }
        }
        return true;
    }

    const char* name() const override { return "records"; }

  private:
    EqualityComparer& owner_;
};

// Implementation of EqualityComparer methods

inline EqualityComparer::EqualityComparer(EqualityOptions options,
                                          core::Tolerance default_floating_point_tolerance)
    : options_(options),
      default_floating_point_tolerance_(std::move(default_floating_point_tolerance)) {
    chain_.push_back(std::make_unique<NumericsComparer>(*this));
    chain_.push_back(std::make_unique<PrimitivesComparer>());
    chain_.push_back(std::make_unique<StringsComparer>(*this));
    chain_.push_back(std::make_unique<TimeSpanComparer>(*this));
    chain_.push_back(std::make_unique<TupleComparer>(*this));
    chain_.push_back(std::make_unique<PairComparer>(*this));
    chain_.push_back(std::make_unique<StructuralComparer>(*this));
    chain_.push_back(std::make_unique<DictionariesComparer>(*this));
    chain_.push_back(std::make_unique<EnumerablesComparer>(*this));
    chain_.push_back(std::make_unique<RecordsComparer>(*this));
}

inline bool EqualityComparer::are_equal(const core::Value& x, const core::Value& y,
                                        core::Tolerance& tolerance, ComparisonState state) {
    if (x.is_null() && y.is_null()) {
        return true;
    }
    if (x.is_null() || y.is_null()) {
        return false;
    }
    if (x.identity() != nullptr && x.identity() == y.identity()) {
        return true;
    }
    // A pair already being compared further up the path is treated as equal
    if (state.did_compare(x, y)) {
        return true;
    }
    for (const auto& comparer : chain_) {
        if (Decision decision = comparer->equal(x, y, tolerance, state)) {
            return *decision;
        }
    }
    return false;
}

} // namespace assertlab::comparers
