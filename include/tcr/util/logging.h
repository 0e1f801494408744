// TCR - Logging System
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Leveled, categorized logging for the protocol components.
//
// Entries are stamped with the protocol clock (util::GetTime()), the same
// clock that stamps events and decides stage boundaries, so a log line and
// the event it accompanies always carry the same time.
//
// Nothing is written until a sink is attached:
//
//   util::Logger::Instance().AddSink(
//       std::make_shared<util::StreamSink>(std::cerr, util::LogLevel::Info));
//   LOG_INFO(util::LogCategory::REGISTRY) << "listing " << id.ToHex() << " applied";

#ifndef TCR_UTIL_LOGGING_H
#define TCR_UTIL_LOGGING_H

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace tcr {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; "warning" is accepted for Warn
std::optional<LogLevel> ParseLogLevel(const std::string& str);

/// One category per protocol component
namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* VOTING = "voting";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* PARAMS = "params";
    constexpr const char* BANK = "bank";
    constexpr const char* TOKEN = "token";
    constexpr const char* CONFIG = "config";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    int64_t protocolTime{0};
};

/// Rendering options for text sinks
struct LogFormat {
    bool showTime{true};
    bool showLocation{false};
};

/**
 * Render an entry as one line:
 *   2023-11-14T22:13:20Z INFO  registry: message (registry.cpp:42)
 * The category is omitted for LogCategory::DEFAULT.
 */
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format = {});

/// File name without its directories
std::string GetBasename(const std::string& path);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    explicit LogSink(LogLevel threshold) : threshold_(threshold) {}
    virtual ~LogSink() = default;

    /// Called only for entries at or above the threshold
    virtual void Write(const LogEntry& entry) = 0;

    void SetThreshold(LogLevel level) { threshold_ = level; }
    LogLevel GetThreshold() const { return threshold_; }

private:
    LogLevel threshold_;
};

/// Formats entries onto a stream (std::cerr, a file, a string buffer)
class StreamSink : public LogSink {
public:
    StreamSink(std::ostream& out, LogLevel threshold = LogLevel::Info,
               LogFormat format = {});

    void Write(const LogEntry& entry) override;

private:
    std::ostream& out_;
    LogFormat format_;
};

/// Hands raw entries to a callback
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel threshold = LogLevel::Trace);

    void Write(const LogEntry& entry) override;

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<LogSink> sink);
    void RemoveSink(const std::shared_ptr<LogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const;

    /// Restrict output to the listed categories (empty = all)
    void SetCategories(std::set<std::string> categories);
    bool IsCategoryEnabled(const std::string& category) const;

    /// True if an entry would reach at least one sink
    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    std::set<std::string> categories_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Stream Macros
// ============================================================================

/// Collects a streamed message and logs it when destroyed
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        buffer_ << value;
        return *this;
    }

private:
    std::ostringstream buffer_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

#define TCR_LOG(level, category) \
    if (!::tcr::util::Logger::Instance().WillLog(::tcr::util::LogLevel::level, category)) {} \
    else ::tcr::util::LogStream(::tcr::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category) TCR_LOG(Trace, category)
#define LOG_DEBUG(category) TCR_LOG(Debug, category)
#define LOG_INFO(category)  TCR_LOG(Info, category)
#define LOG_WARN(category)  TCR_LOG(Warn, category)
#define LOG_ERROR(category) TCR_LOG(Error, category)

} // namespace util
} // namespace tcr

#endif // TCR_UTIL_LOGGING_H
