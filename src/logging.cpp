#include "toolgate/logging.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/util/time.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace toolgate
{

std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Critical:
        return "CRITICAL";
    }
    return "INFO";
}

LogLevel log_level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return LogLevel::Debug;
    if (upper == "INFO")
        return LogLevel::Info;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::Warning;
    if (upper == "ERROR")
        return LogLevel::Error;
    if (upper == "CRITICAL")
        return LogLevel::Critical;
    throw ValidationError("unknown log level: " + name);
}

std::string format_record(const LogRecord& record)
{
    return util::to_iso8601(record.timestamp) + " - " + record.logger + " - " +
           to_string(record.level) + " - " + record.message;
}

Json to_json(const LogRecord& record)
{
    return Json{{"timestamp", util::to_iso8601(record.timestamp)},
                {"level", to_string(record.level)},
                {"logger", record.logger},
                {"message", record.message}};
}

LogSink stderr_sink()
{
    auto mutex = std::make_shared<std::mutex>();
    return [mutex](const LogRecord& record)
    {
        std::lock_guard<std::mutex> lock(*mutex);
        std::cerr << format_record(record) << std::endl;
    };
}

void Logger::log(LogLevel level, const std::string& logger, const std::string& message) const
{
    if (!enabled(level))
        return;

    LogRecord record;
    record.timestamp = std::chrono::system_clock::now();
    record.level = level;
    record.logger = logger;
    record.message = message;

    for (const auto& sink : sinks_)
        if (sink)
            sink(record);
}

void LogBuffer::push(const LogRecord& record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
    while (records_.size() > capacity_)
        records_.pop_front();
}

std::vector<LogRecord> LogBuffer::recent(size_t count) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = (count == 0 || count > records_.size()) ? records_.size() : count;
    return std::vector<LogRecord>(records_.end() - static_cast<std::ptrdiff_t>(n),
                                  records_.end());
}

size_t LogBuffer::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

LogSink LogBuffer::sink()
{
    return [this](const LogRecord& record) { push(record); };
}

} // namespace toolgate
