#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <toml.hpp>

#include <assertlab/context/execution_context.hpp>
#include <assertlab/core/tolerance.hpp>
#include <assertlab/core/value_format.hpp>
#include <assertlab/utils/logger.hpp>

namespace assertlab::config {

/// Custom exception for configuration validation errors
class ConfigValidationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Default floating-point tolerance applied by contexts
struct ToleranceConfig {
    std::string mode = "none"; // none, linear, percent, ulps or time_span
    double amount = 0.0;       // Milliseconds when mode is time_span
};

/// Display limits for values in failure messages
struct FormatterConfig {
    std::size_t max_items = 10;        // Items shown per collection
    std::size_t max_string_length = 0; // 0 disables truncation
};

/// Internal trace output
struct TraceConfig {
    std::string level = "off";     // off, error, warning, info, debug
    std::string target = "stderr"; // stderr or stdout
};

/// Command-line override structure
/// Contains optional overrides for configuration parameters
struct ConfigOverrides {
    std::optional<std::string> tolerance_mode;
    std::optional<double> tolerance_amount;
    std::optional<std::size_t> max_items;
    std::optional<std::string> trace_level;
};

/// Complete configuration structure
struct Config {
    ToleranceConfig tolerance;
    FormatterConfig formatter;
    TraceConfig trace;

    /// Load configuration from TOML file
    /// Validates all parameters and applies defaults for missing values
    static Config from_file(const std::string& filepath);

    /// Load configuration from TOML string
    static Config from_string(const std::string& toml_string);

    /// Validate configuration parameters
    /// Throws ConfigValidationError if any parameter is invalid
    void validate() const;

    /// Export configuration to TOML string
    std::string to_toml() const;

    /// Apply command-line overrides and re-validate
    void apply_overrides(const ConfigOverrides& overrides);

    /// Tolerance described by the [tolerance] section
    core::Tolerance default_tolerance() const;

    core::FormatOptions format_options() const {
        return {.max_items = formatter.max_items, .max_string_length = formatter.max_string_length};
    }

    /// Install tolerance and formatter settings on a context
    void apply_to(context::ExecutionContext& context) const;

    /// Route internal tracing according to the [trace] section
    void configure_trace() const;

  private:
    static Config parse(const toml::value& data);
    static ToleranceConfig parse_tolerance(const toml::value& data);
    static FormatterConfig parse_formatter(const toml::value& data);
    static TraceConfig parse_trace(const toml::value& data);

    static std::optional<core::ToleranceMode> parse_mode(const std::string& mode);

    static utils::Logger& log() {
        static utils::Logger logger("assertlab.config.Config");
        return logger;
    }
};

// Implementation of Config methods

inline Config Config::from_file(const std::string& filepath) {
    const auto data = toml::parse(filepath);
    Config config = parse(data);
    log().info("Loaded configuration from {}", filepath);
    return config;
}

inline Config Config::from_string(const std::string& toml_string) {
    std::istringstream iss(toml_string);
    const auto data = toml::parse(iss, "config_string");
    return parse(data);
}

inline Config Config::parse(const toml::value& data) {
    Config config;

    // Parse each section if it exists, otherwise use defaults
    if (data.contains("tolerance")) {
        config.tolerance = parse_tolerance(data);
    }

    if (data.contains("formatter")) {
        config.formatter = parse_formatter(data);
    }

    if (data.contains("trace")) {
        config.trace = parse_trace(data);
    }

    config.validate();
    return config;
}

inline void Config::validate() const {
    auto mode = parse_mode(tolerance.mode);
    if (!mode) {
        throw ConfigValidationError("Unknown tolerance mode: " + tolerance.mode);
    }

    if (tolerance.amount < 0.0) {
        throw ConfigValidationError("Tolerance amount cannot be negative");
    }

    if (*mode == core::ToleranceMode::ulps &&
        tolerance.amount != static_cast<double>(static_cast<long long>(tolerance.amount))) {
        throw ConfigValidationError("Ulps tolerance must be a whole number");
    }

    if (!utils::parse_trace_level(trace.level)) {
        throw ConfigValidationError("Unknown trace level: " + trace.level);
    }

    if (trace.target != "stderr" && trace.target != "stdout") {
        throw ConfigValidationError("Trace target must be stderr or stdout");
    }
}

inline ToleranceConfig Config::parse_tolerance(const toml::value& data) {
    ToleranceConfig tolerance;
    const auto& table = toml::find(data, "tolerance");

    if (table.contains("mode")) {
        tolerance.mode = toml::find<std::string>(table, "mode");
    }

    if (table.contains("amount")) {
        // Accept both integer and floating-point amounts
        const auto& amount = toml::find(table, "amount");
        if (amount.is_integer()) {
            tolerance.amount = static_cast<double>(toml::find<std::int64_t>(table, "amount"));
        } else {
            tolerance.amount = toml::find<double>(table, "amount");
        }
    }

    return tolerance;
}

inline FormatterConfig Config::parse_formatter(const toml::value& data) {
    FormatterConfig formatter;
    const auto& table = toml::find(data, "formatter");

    if (table.contains("max_items")) {
        formatter.max_items = toml::find<std::size_t>(table, "max_items");
    }

    if (table.contains("max_string_length")) {
        formatter.max_string_length = toml::find<std::size_t>(table, "max_string_length");
    }

    return formatter;
}

inline TraceConfig Config::parse_trace(const toml::value& data) {
    TraceConfig trace;
    const auto& table = toml::find(data, "trace");

    if (table.contains("level")) {
        trace.level = toml::find<std::string>(table, "level");
    }

    if (table.contains("target")) {
        trace.target = toml::find<std::string>(table, "target");
    }

    return trace;
}

inline std::optional<core::ToleranceMode> Config::parse_mode(const std::string& mode) {
    if (mode == "none") {
        return core::ToleranceMode::none;
    }
    if (mode == "linear") {
        return core::ToleranceMode::linear;
    }
    if (mode == "percent") {
        return core::ToleranceMode::percent;
    }
    if (mode == "ulps") {
        return core::ToleranceMode::ulps;
    }
    if (mode == "time_span") {
        return core::ToleranceMode::time_span;
    }
    return std::nullopt;
}

inline core::Tolerance Config::default_tolerance() const {
    validate();
    auto mode = *parse_mode(tolerance.mode);
    if (mode == core::ToleranceMode::time_span) {
        return core::Tolerance(tolerance.amount).milliseconds();
    }
    return core::Tolerance::from_mode(mode, tolerance.amount);
}

inline void Config::apply_to(context::ExecutionContext& context) const {
    context.set_default_floating_point_tolerance(default_tolerance());
    context.add_formatter([options = format_options()](core::ValueFormatter) {
        return core::make_default_formatter(options);
    });
    log().debug("Applied tolerance mode {} and formatter limit {} to context", tolerance.mode,
                formatter.max_items);
}

inline void Config::configure_trace() const {
    auto level = utils::parse_trace_level(trace.level);
    if (!level) {
        throw ConfigValidationError("Unknown trace level: " + trace.level);
    }
    if (*level == utils::TraceLevel::off) {
        utils::InternalTrace::shutdown();
        return;
    }
    utils::InternalTrace::initialize(*level, trace.target == "stdout" ? std::cout : std::clog);
}

inline std::string Config::to_toml() const {
    toml::value root;

    // Tolerance section
    toml::value tolerance_table;
    tolerance_table["mode"] = tolerance.mode;
    tolerance_table["amount"] = tolerance.amount;
    root["tolerance"] = tolerance_table;

    // Formatter section
    toml::value formatter_table;
    formatter_table["max_items"] = formatter.max_items;
    formatter_table["max_string_length"] = formatter.max_string_length;
    root["formatter"] = formatter_table;

    // Trace section
    toml::value trace_table;
    trace_table["level"] = trace.level;
    trace_table["target"] = trace.target;
    root["trace"] = trace_table;

    std::stringstream ss;
    ss << toml::format(root);
    return ss.str();
}

inline void Config::apply_overrides(const ConfigOverrides& overrides) {
    // Apply overrides only if they are set
    if (overrides.tolerance_mode.has_value()) {
        tolerance.mode = overrides.tolerance_mode.value();
    }

    if (overrides.tolerance_amount.has_value()) {
        tolerance.amount = overrides.tolerance_amount.value();
    }

    if (overrides.max_items.has_value()) {
        formatter.max_items = overrides.max_items.value();
    }

    if (overrides.trace_level.has_value()) {
        trace.level = overrides.trace_level.value();
    }

    // Re-validate after applying overrides
    validate();
}

} // namespace assertlab::config
