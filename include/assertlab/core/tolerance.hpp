#pragma once

/// @file tolerance.hpp
/// @brief Numeric and time slack windows used to relax equality

#include <bit>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <string>

#include <assertlab/core/errors.hpp>
#include <assertlab/core/value.hpp>
#include <assertlab/core/value_format.hpp>

namespace assertlab::core {

enum class ToleranceMode { none, linear, percent, ulps, time_span };

inline const char* to_string(ToleranceMode mode) {
    switch (mode) {
    case ToleranceMode::none:
        return "none";
    case ToleranceMode::linear:
        return "linear";
    case ToleranceMode::percent:
        return "percent";
    case ToleranceMode::ulps:
        return "ulps";
    case ToleranceMode::time_span:
        return "time_span";
    }
    return "unknown";
}

/// Inclusive bounds derived from an expected value
struct Range {
    Value lower_bound;
    Value upper_bound;
};

/// Immutable slack window
///
/// A tolerance is built from an amount (linear by default) and optionally switched to
/// percent, ulps or a time unit. The default tolerance is unset: comparisons treat it
/// as exact, but a floating-point comparison may replace it with the context default.
class Tolerance {
  public:
    /// Linear tolerance of `amount`
    explicit Tolerance(double amount) : Tolerance(ToleranceMode::linear, amount) {}

    /// Time-span tolerance
    template <typename Rep, typename Period>
    explicit Tolerance(std::chrono::duration<Rep, Period> span)
        : mode_(ToleranceMode::time_span),
          amount_(static_cast<double>(
              std::chrono::duration_cast<std::chrono::nanoseconds>(span).count())),
          explicitly_set_(true) {
        if (span < std::chrono::duration<Rep, Period>::zero()) {
            throw ToleranceError("Tolerance amount must not be negative");
        }
    }

    static const Tolerance& default_tolerance() {
        static const Tolerance instance(ToleranceMode::none, 0.0, false);
        return instance;
    }

    /// Zero linear tolerance; explicitly set, so never replaced by a context default
    static const Tolerance& exact() {
        static const Tolerance instance(ToleranceMode::linear, 0.0);
        return instance;
    }

    static Tolerance linear(double amount) { return Tolerance(ToleranceMode::linear, amount); }
    static Tolerance percent(double amount) { return Tolerance(ToleranceMode::percent, amount); }
    static Tolerance ulps(double amount) { return Tolerance(ToleranceMode::ulps, amount); }

    /// Rebuild from a configured mode name and amount
    static Tolerance from_mode(ToleranceMode mode, double amount) {
        if (mode == ToleranceMode::none) {
            return default_tolerance();
        }
        return Tolerance(mode, amount);
    }

    ToleranceMode mode() const { return mode_; }
    double amount() const { return amount_; }
    bool is_unset_or_default() const { return !explicitly_set_; }

    std::chrono::nanoseconds span() const {
        return std::chrono::nanoseconds(static_cast<std::int64_t>(amount_));
    }

    // Mode switches; valid only from a plain linear amount
    Tolerance percent() const { return switch_to(ToleranceMode::percent, amount_); }
    Tolerance ulps() const { return switch_to(ToleranceMode::ulps, amount_); }
    Tolerance nanoseconds() const { return to_span(1.0); }
    Tolerance microseconds() const { return to_span(1e3); }
    Tolerance milliseconds() const { return to_span(1e6); }
    Tolerance seconds() const { return to_span(1e9); }
    Tolerance minutes() const { return to_span(60e9); }

    /// Bounds of the window around `expected`
    ///
    /// @throws ToleranceError when the mode cannot apply to the value's kind
    Range apply_to_value(const Value& expected) const {
        switch (mode_) {
        case ToleranceMode::none:
            return {expected, expected};
        case ToleranceMode::linear:
            require_numeric(expected);
            return linear_range(expected);
        case ToleranceMode::percent: {
            require_numeric(expected);
            double center = expected.to_double();
            double offset = std::abs(center) * amount_ / 100.0;
            return {Value(center - offset), Value(center + offset)};
        }
        case ToleranceMode::ulps: {
            if (!expected.is_floating()) {
                throw ToleranceError("Ulps may only be specified for floating point arguments");
            }
            auto steps = static_cast<std::int64_t>(amount_);
            return {Value(step_ulps(expected.as_double(), -steps)),
                    Value(step_ulps(expected.as_double(), steps))};
        }
        case ToleranceMode::time_span:
            if (!expected.is_duration()) {
                throw ToleranceError(
                    std::format("A time span tolerance cannot be applied to a {} value",
                                core::to_string(expected.kind())));
            }
            return {Value(expected.as_duration() - span()), Value(expected.as_duration() + span())};
        }
        return {expected, expected};
    }

    /// Description suffix, e.g. "+/- 5 Percent"
    std::string to_string() const {
        switch (mode_) {
        case ToleranceMode::none:
            return "";
        case ToleranceMode::linear:
            return "+/- " + trimmed(amount_);
        case ToleranceMode::percent:
            return "+/- " + trimmed(amount_) + " Percent";
        case ToleranceMode::ulps:
            return "+/- " + trimmed(amount_) + " Ulps";
        case ToleranceMode::time_span:
            return "+/- " + detail::format_duration(span());
        }
        return "";
    }

    bool operator==(const Tolerance& other) const {
        return mode_ == other.mode_ && amount_ == other.amount_;
    }

  private:
    Tolerance(ToleranceMode mode, double amount, bool explicitly_set = true)
        : mode_(mode), amount_(amount), explicitly_set_(explicitly_set) {
        if (amount < 0.0 || std::isnan(amount)) {
            throw ToleranceError("Tolerance amount must not be negative");
        }
        if (mode == ToleranceMode::ulps && amount != std::floor(amount)) {
            throw ToleranceError("Ulps tolerance must be a whole number of units");
        }
    }

    Tolerance switch_to(ToleranceMode mode, double amount) const {
        if (mode_ != ToleranceMode::linear) {
            throw ToleranceError("Tried to use multiple tolerance modes at the same time");
        }
        return Tolerance(mode, amount);
    }

    Tolerance to_span(double nanoseconds_per_unit) const {
        return switch_to(ToleranceMode::time_span, std::round(amount_ * nanoseconds_per_unit));
    }

    static void require_numeric(const Value& expected) {
        if (!expected.is_numeric()) {
            throw ToleranceError(std::format("Cannot apply a numeric tolerance to a {} value",
                                             core::to_string(expected.kind())));
        }
    }

    Range linear_range(const Value& expected) const {
        bool whole_amount = amount_ == std::floor(amount_) &&
                            amount_ < static_cast<double>(std::numeric_limits<std::int64_t>::max());
        if (expected.kind() == ValueKind::integer && whole_amount) {
            std::int64_t center = expected.as_integer();
            auto offset = static_cast<std::int64_t>(amount_);
            constexpr auto lowest = std::numeric_limits<std::int64_t>::min();
            constexpr auto highest = std::numeric_limits<std::int64_t>::max();
            // Saturate instead of wrapping at the ends of the integer range
            std::int64_t lower = center < lowest + offset ? lowest : center - offset;
            std::int64_t upper = center > highest - offset ? highest : center + offset;
            return {Value(lower), Value(upper)};
        }
        double center = expected.to_double();
        return {Value(center - amount_), Value(center + amount_)};
    }

    /// Move `steps` representable doubles away from `value`
    static double step_ulps(double value, std::int64_t steps) {
        if (std::isnan(value) || std::isinf(value)) {
            return value;
        }
        // Map the sign-magnitude bit pattern onto a monotonic integer line
        auto bits = std::bit_cast<std::int64_t>(value);
        if (bits < 0) {
            bits = std::numeric_limits<std::int64_t>::min() - bits;
        }
        bits += steps;
        if (bits < 0) {
            bits = std::numeric_limits<std::int64_t>::min() - bits;
        }
        return std::bit_cast<double>(bits);
    }

    static std::string trimmed(double amount) { return std::format("{}", amount); }

    ToleranceMode mode_;
    double amount_;
    bool explicitly_set_;
};

} // namespace assertlab::core
