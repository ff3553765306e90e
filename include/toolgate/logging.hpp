#pragma once
#include "toolgate/types.hpp"

#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace toolgate
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

std::string to_string(LogLevel level);

/// Parse "DEBUG", "info", "warn", ... ; throws ValidationError on unknown names
LogLevel log_level_from_string(const std::string& name);

struct LogRecord
{
    std::chrono::system_clock::time_point timestamp;
    LogLevel level{LogLevel::Info};
    std::string logger;
    std::string message;
};

/// "<ISO8601> - <logger> - <LEVEL> - <message>"
std::string format_record(const LogRecord& record);

Json to_json(const LogRecord& record);

using LogSink = std::function<void(const LogRecord&)>;

/// Sink writing formatted records to stderr (stdout belongs to the stdio transport)
LogSink stderr_sink();

/// Level-filtered fan-out to a list of sinks. Created at startup and passed to the
/// components that log; sinks are installed before serving begins.
class Logger
{
  public:
    explicit Logger(std::string name = "toolgate", LogLevel level = LogLevel::Info)
        : name_(std::move(name)), level_(level)
    {
    }

    void add_sink(LogSink sink)
    {
        sinks_.push_back(std::move(sink));
    }

    void set_level(LogLevel level)
    {
        level_ = level;
    }
    LogLevel level() const
    {
        return level_;
    }
    const std::string& name() const
    {
        return name_;
    }

    bool enabled(LogLevel level) const
    {
        return level >= level_;
    }

    void log(LogLevel level, const std::string& message) const
    {
        log(level, name_, message);
    }
    void log(LogLevel level, const std::string& logger, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

  private:
    std::string name_;
    LogLevel level_;
    std::vector<LogSink> sinks_;
};

/// Bounded in-memory record buffer; oldest entries are dropped first
class LogBuffer
{
  public:
    explicit LogBuffer(size_t capacity = 100) : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(const LogRecord& record);

    /// Most recent records, oldest first; count == 0 returns everything
    std::vector<LogRecord> recent(size_t count = 0) const;

    size_t size() const;
    size_t capacity() const
    {
        return capacity_;
    }

    /// Sink adapter; the buffer must outlive the returned sink
    LogSink sink();

  private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<LogRecord> records_;
};

} // namespace toolgate
