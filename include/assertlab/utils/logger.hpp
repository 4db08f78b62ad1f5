#pragma once

/// @file logger.hpp
/// @brief Internal trace logging for the assertion engine
///
/// Tracing is off unless a level and an output stream are configured through
/// InternalTrace::initialize (or a [trace] configuration section). Each line reads
/// `HH:MM:SS.mmm Level [thread] name: message`.

#include <chrono>
#include <format>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace assertlab::utils {

enum class TraceLevel { off, error, warning, info, debug };

inline const char* to_string(TraceLevel level) {
    switch (level) {
    case TraceLevel::off:
        return "Off";
    case TraceLevel::error:
        return "Error";
    case TraceLevel::warning:
        return "Warning";
    case TraceLevel::info:
        return "Info";
    case TraceLevel::debug:
        return "Debug";
    }
    return "Unknown";
}

/// Process-wide trace switch shared by every Logger
class InternalTrace {
  public:
    /// Route trace output to `stream` at `level`; the stream must outlive tracing
    static void initialize(TraceLevel level, std::ostream& stream = std::clog) {
        std::lock_guard lock(state().mutex);
        state().level = level;
        state().stream = &stream;
    }

    static void shutdown() {
        std::lock_guard lock(state().mutex);
        state().level = TraceLevel::off;
        state().stream = nullptr;
    }

    static TraceLevel level() {
        std::lock_guard lock(state().mutex);
        return state().level;
    }

    static bool enabled(TraceLevel level) {
        std::lock_guard lock(state().mutex);
        return state().stream != nullptr && level != TraceLevel::off && level <= state().level;
    }

    static void write(TraceLevel level, std::string_view name, std::string_view message) {
        auto now = std::chrono::system_clock::now();
        auto since_midnight = now - std::chrono::floor<std::chrono::days>(now);
        auto time = std::chrono::hh_mm_ss(
            std::chrono::duration_cast<std::chrono::milliseconds>(since_midnight));
        std::ostringstream thread_id;
        thread_id << std::this_thread::get_id();

        std::lock_guard lock(state().mutex);
        if (state().stream == nullptr || level > state().level) {
            return;
        }
        *state().stream << std::format("{:%T} {:<7} [{}] {}: {}\n", time, to_string(level),
                                       thread_id.str(), name, message);
    }

  private:
    struct State {
        std::mutex mutex;
        TraceLevel level = TraceLevel::off;
        std::ostream* stream = nullptr;
    };

    static State& state() {
        static State instance;
        return instance;
    }
};

/// Named trace source; only the last component of a dotted or scoped name is shown
class Logger {
  public:
    explicit Logger(std::string_view name) : name_(short_name(name)) {}

    const std::string& name() const { return name_; }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) const {
        log(TraceLevel::error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warning(std::format_string<Args...> fmt, Args&&... args) const {
        log(TraceLevel::warning, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) const {
        log(TraceLevel::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) const {
        log(TraceLevel::debug, fmt, std::forward<Args>(args)...);
    }

  private:
    template <typename... Args>
    void log(TraceLevel level, std::format_string<Args...> fmt, Args&&... args) const {
        // Skip formatting entirely when the level is filtered out
        if (InternalTrace::enabled(level)) {
            InternalTrace::write(level, name_, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    static std::string short_name(std::string_view name) {
        auto index = name.find_last_of(".:");
        return std::string(index == std::string_view::npos ? name : name.substr(index + 1));
    }

    std::string name_;
};

/// Parse a level name as written in configuration files
inline std::optional<TraceLevel> parse_trace_level(std::string_view text) {
    if (text == "off") {
        return TraceLevel::off;
    }
    if (text == "error") {
        return TraceLevel::error;
    }
    if (text == "warning") {
        return TraceLevel::warning;
    }
    if (text == "info") {
        return TraceLevel::info;
    }
    if (text == "debug" || text == "verbose") {
        return TraceLevel::debug;
    }
    return std::nullopt;
}

} // namespace assertlab::utils
