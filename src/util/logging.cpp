// TCR - Logging Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/util/logging.h"
#include "tcr/util/time.h"

#include <algorithm>
#include <cctype>
#include <iomanip>

namespace tcr {
namespace util {

// ============================================================================
// Levels
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

std::optional<LogLevel> ParseLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<const char*, LogLevel> kNames[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},   {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
        {"off", LogLevel::Off},
    };
    for (const auto& [name, level] : kNames) {
        if (lower == name) {
            return level;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Formatting
// ============================================================================

std::string GetBasename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream line;

    if (format.showTime) {
        line << FormatISO8601(entry.protocolTime) << ' ';
    }
    line << std::left << std::setw(6) << LogLevelToString(entry.level);
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        line << entry.category << ": ";
    }
    line << entry.message;
    if (format.showLocation && !entry.file.empty()) {
        line << " (" << GetBasename(entry.file) << ':' << entry.line << ')';
    }
    return line.str();
}

// ============================================================================
// Sinks
// ============================================================================

StreamSink::StreamSink(std::ostream& out, LogLevel threshold, LogFormat format)
    : LogSink(threshold), out_(out), format_(format) {}

void StreamSink::Write(const LogEntry& entry) {
    out_ << FormatLogEntry(entry, format_) << '\n';
    if (entry.level >= LogLevel::Error) {
        out_.flush();
    }
}

CallbackSink::CallbackSink(Callback callback, LogLevel threshold)
    : LogSink(threshold), callback_(std::move(callback)) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::SetCategories(std::set<std::string> categories) {
    std::lock_guard<std::mutex> lock(mutex_);
    categories_ = std::move(categories);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return categories_.empty() || categories_.count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::Off || level < level_ || sinks_.empty()) {
        return false;
    }
    return categories_.empty() || categories_.count(category) > 0;
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.protocolTime = GetTime();

    // Sinks run outside the lock so a callback may log again
    std::vector<std::shared_ptr<LogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        if (level >= sink->GetThreshold()) {
            sink->Write(entry);
        }
    }
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, buffer_.str(), file_, line_);
}

} // namespace util
} // namespace tcr
