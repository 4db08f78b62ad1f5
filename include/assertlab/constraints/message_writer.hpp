#pragma once

/// @file message_writer.hpp
/// @brief Line-oriented builder for assertion failure messages

#include <string>
#include <utility>
#include <vector>

#include <assertlab/core/value.hpp>
#include <assertlab/core/value_format.hpp>

namespace assertlab::constraints {

/// Collects the lines of a failure message
///
/// Actual values go through the supplied formatter, which is normally the formatter
/// chain of the current execution context. Expected text arrives pre-rendered as a
/// constraint description.
class MessageWriter {
  public:
    explicit MessageWriter(core::ValueFormatter formatter = core::make_default_formatter())
        : formatter_(std::move(formatter)) {}

    /// User-supplied message; empty messages are skipped
    void write_message_line(const std::string& message) {
        if (!message.empty()) {
            lines_.push_back(message);
        }
    }

    void write_expected_line(const std::string& description) {
        lines_.push_back("  Expected: " + description);
    }

    void write_actual_line(const core::Value& actual) {
        lines_.push_back("  But was:  " + format(actual));
    }

    void write_line(std::string line) { lines_.push_back(std::move(line)); }

    std::string format(const core::Value& value) const { return formatter_(value); }

    const std::vector<std::string>& lines() const { return lines_; }

    std::string str() const {
        std::string text;
        for (std::size_t i = 0; i < lines_.size(); ++i) {
            if (i > 0) {
                text += '\n';
            }
            text += lines_[i];
        }
        return text;
    }

  private:
    core::ValueFormatter formatter_;
    std::vector<std::string> lines_;
};

} // namespace assertlab::constraints
