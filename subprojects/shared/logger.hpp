#pragma once
#include <iostream>
#include <vector>
#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <algorithm>
#include <climits>
#include <cstdint>

// Usage:
//   auto logger = std::make_shared<Logger>("rulecheck");
//   logger->add_sink(std::make_shared<StderrSink>());
//   logger->info("Registered rules: 3");

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

// Accepts "debug", "info", "warning", "error", "critical" (lower case).
inline std::optional<LogLevel> parse_log_level(std::string_view text) {
    if (text == "debug")    return LogLevel::Debug;
    if (text == "info")     return LogLevel::Info;
    if (text == "warning")  return LogLevel::Warning;
    if (text == "error")    return LogLevel::Error;
    if (text == "critical") return LogLevel::Critical;
    return std::nullopt;
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }
protected:
    LogLevel min_level_ = LogLevel::Info; // Default level set to INFO
};

// Keeps warnings and errors off stdout so program output stays parseable.
class StderrSink : public LogSink {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[" << to_string(level) << "] " << message << std::endl;
    }
private:
    std::mutex mutex_;
};

// In-memory sink; tests read back what components reported.
class VectorSink : public LogSink {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << "[" << to_string(level) << "] " << message;
        lines_.push_back(oss.str());
        levels_.push_back(level);
    }
    std::vector<std::string> get_lines(size_t start = 0, size_t count = SIZE_MAX, LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> filtered;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level) {
                filtered.push_back(lines_[i]);
            }
        }
        if (start >= filtered.size()) return {};
        size_t end = (std::min)(start + count, filtered.size());
        return std::vector<std::string>(filtered.begin() + start, filtered.begin() + end);
    }
    // Number of lines at or above min_level containing needle
    size_t count_matching(const std::string& needle, LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level && lines_[i].find(needle) != std::string::npos) ++n;
        }
        return n;
    }
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }
private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

class Logger {
public:
    Logger() : name_("Default") {}

    explicit Logger(const std::string& name) : name_(name) {}

    // Sinks are added during setup, before the logger is shared across threads.
    void add_sink(std::shared_ptr<LogSink> sink) {
        sinks_.push_back(std::move(sink));
    }

    void log(LogLevel level, const std::string& message) {
        for (const auto& sink : sinks_) {
            sink->log(level, message);
        }
    }

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    const std::string& name() const { return name_; }

    std::vector<std::string> get_lines(int start = 0, int count = INT_MAX, LogLevel min_level = LogLevel::Debug) const {
        for (const auto& sink : sinks_) {
            auto vector_sink = std::dynamic_pointer_cast<VectorSink>(sink);
            if (vector_sink) {
                return vector_sink->get_lines(static_cast<size_t>(start), static_cast<size_t>(count), min_level);
            }
        }
        return {};
    }

private:
    std::string name_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
};
