#pragma once

/// @file value_format.hpp
/// @brief Default display formatting for values in descriptions and failure messages

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <format>
#include <functional>
#include <string>
#include <vector>

#include <assertlab/core/value.hpp>

namespace assertlab::core {

/// Limits applied by the default formatter
struct FormatOptions {
    std::size_t max_items = 10;         // Items shown per collection before eliding
    std::size_t max_string_length = 0;  // 0 disables truncation
};

/// Function from value to display text
using ValueFormatter = std::function<std::string(const Value&)>;

/// Wraps the current formatter to produce the next one in the chain
using ValueFormatterFactory = std::function<ValueFormatter(ValueFormatter next)>;

namespace detail {

inline std::string format_double(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    std::string text = std::format("{}", value);
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text + "d";
}

inline std::string format_duration(std::chrono::nanoseconds value) {
    using namespace std::chrono;
    auto count = value.count();
    if (count != 0 && count % duration_cast<nanoseconds>(seconds(1)).count() == 0) {
        return std::format("{}", duration_cast<seconds>(value));
    }
    if (count != 0 && count % duration_cast<nanoseconds>(milliseconds(1)).count() == 0) {
        return std::format("{}", duration_cast<milliseconds>(value));
    }
    if (count != 0 && count % duration_cast<nanoseconds>(microseconds(1)).count() == 0) {
        return std::format("{}", duration_cast<microseconds>(value));
    }
    return std::format("{}", value);
}

class ValueWriter {
  public:
    explicit ValueWriter(const FormatOptions& options) : options_(options) {}

    std::string write(const Value& value) {
        const void* identity = value.identity();
        if (identity != nullptr &&
            std::find(path_.begin(), path_.end(), identity) != path_.end()) {
            return "<...>";
        }
        if (identity != nullptr) {
            path_.push_back(identity);
        }
        std::string text = write_unguarded(value);
        if (identity != nullptr) {
            path_.pop_back();
        }
        return text;
    }

  private:
    std::string write_unguarded(const Value& value) {
        switch (value.kind()) {
        case ValueKind::null:
            return "null";
        case ValueKind::boolean:
            return value.as_bool() ? "true" : "false";
        case ValueKind::integer:
            return std::to_string(value.as_integer());
        case ValueKind::unsigned_integer:
            return std::to_string(value.as_unsigned());
        case ValueKind::floating:
            return format_double(value.as_double());
        case ValueKind::string:
            return write_string(value.as_string());
        case ValueKind::duration:
            return format_duration(value.as_duration());
        case ValueKind::sequence:
            return write_items(value.as_sequence().items, "< ", " >", "<empty>");
        case ValueKind::dictionary:
            return write_dictionary(value.as_dictionary());
        case ValueKind::tuple:
            return write_items(value.as_tuple().items, "(", ")", "()");
        case ValueKind::record:
            return write_record(value.as_record());
        case ValueKind::structural:
            return "<" + value.as_structural().describe() + ">";
        }
        return "<?>";
    }

    std::string write_string(const std::string& text) const {
        if (options_.max_string_length > 0 && text.size() > options_.max_string_length) {
            return "\"" + text.substr(0, options_.max_string_length) + "...\"";
        }
        return "\"" + text + "\"";
    }

    std::string write_items(const std::vector<Value>& items, const char* open, const char* close,
                            const char* empty) {
        if (items.empty()) {
            return empty;
        }
        std::string text = open;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i > 0) {
                text += ", ";
            }
            if (options_.max_items > 0 && i == options_.max_items) {
                text += "...";
                break;
            }
            text += write(items[i]);
        }
        return text + close;
    }

    std::string write_dictionary(const Dictionary& dictionary) {
        if (dictionary.entries.empty()) {
            return "<empty>";
        }
        std::string text = "[ ";
        for (std::size_t i = 0; i < dictionary.entries.size(); ++i) {
            if (i > 0) {
                text += ", ";
            }
            if (options_.max_items > 0 && i == options_.max_items) {
                text += "...";
                break;
            }
            text += "[" + write(dictionary.entries[i].first) + ", " +
                    write(dictionary.entries[i].second) + "]";
        }
        return text + " ]";
    }

    std::string write_record(const Record& record) {
        std::string text = "<" + record.type.name;
        if (!record.members.empty()) {
            text += " {";
            for (std::size_t i = 0; i < record.members.size(); ++i) {
                text += (i == 0 ? " " : ", ") + record.members[i].first + " = " +
                        write(record.members[i].second);
            }
            text += " }";
        }
        return text + ">";
    }

    const FormatOptions& options_;
    std::vector<const void*> path_;
};

} // namespace detail

/// Format a value for display; self-referential composites print as `<...>`
inline std::string format_value(const Value& value, const FormatOptions& options = {}) {
    detail::ValueWriter writer(options);
    return writer.write(value);
}

inline ValueFormatter make_default_formatter(FormatOptions options = {}) {
    return [options](const Value& value) { return format_value(value, options); };
}

} // namespace assertlab::core
