#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace toolgate::util
{

/// UTC timestamp with millisecond precision, e.g. "2024-05-01T12:00:00.250Z"
inline std::string to_iso8601(std::chrono::system_clock::time_point tp)
{
    using clock = std::chrono::system_clock;
    std::time_t t = clock::to_time_t(tp);
#ifdef _WIN32
    std::tm tm;
    gmtime_s(&tm, &t);
#else
    std::tm tm;
    gmtime_r(&t, &tm);
#endif
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    if (ms.count() < 0)
        ms += std::chrono::milliseconds(1000);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << ms.count() << 'Z';
    return oss.str();
}

inline std::string to_iso8601_now()
{
    return to_iso8601(std::chrono::system_clock::now());
}

/// Seconds with three decimals and an "s" suffix, e.g. "0.042s"
inline std::string format_seconds(std::chrono::steady_clock::duration d)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << std::chrono::duration<double>(d).count() << 's';
    return oss.str();
}

} // namespace toolgate::util
