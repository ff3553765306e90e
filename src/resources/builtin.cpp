#include "toolgate/resources/builtin.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/util/json.hpp"
#include "toolgate/util/time.hpp"
#include "toolgate/version.hpp"

#include <cstdio>
#include <optional>
#include <thread>
#include <unistd.h>

namespace toolgate::resources
{

namespace
{

constexpr const char* kJsonMime = "application/json";

std::string format_uptime(std::chrono::steady_clock::duration d)
{
    using namespace std::chrono;
    auto secs = duration_cast<seconds>(d).count();
    const auto days = secs / 86400;
    secs %= 86400;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%lldd %02lld:%02lld:%02lld", static_cast<long long>(days),
                  static_cast<long long>(secs / 3600), static_cast<long long>((secs % 3600) / 60),
                  static_cast<long long>(secs % 60));
    return buf;
}

} // namespace

Resource make_config_resource(const Settings& settings)
{
    Resource r;
    r.uri = "config://settings";
    r.name = "Server Configuration";
    r.description = "Current server configuration settings";
    r.mime_type = kJsonMime;
    // Settings are fixed once serving starts; snapshot at registration
    auto text = util::json::dump_pretty(settings.to_json());
    r.provider = [text](const Json&)
    { return ResourceContent{"config://settings", std::string(kJsonMime), text}; };
    return r;
}

Resource make_status_resource(const Settings& settings, const server::ServerStats& stats,
                              std::shared_ptr<const server::RateLimiter> limiter)
{
    Resource r;
    r.uri = "status://server";
    r.name = "Server Status";
    r.description = "Current server status and metrics";
    r.mime_type = kJsonMime;

    auto app_name = settings.app_name;
    auto environment = settings.environment;
    const auto* stats_ptr = &stats;
    r.provider = [app_name, environment, stats_ptr, limiter](const Json&)
    {
        const auto uptime = stats_ptr->uptime();
        Json status = {
            {"server",
             Json{{"name", app_name},
                  {"version", VERSION_STRING},
                  {"environment", environment},
                  {"status", "healthy"},
                  {"uptime_seconds",
                   std::chrono::duration_cast<std::chrono::duration<double>>(uptime).count()},
                  {"uptime_formatted", format_uptime(uptime)},
                  {"current_time", util::to_iso8601_now()},
                  {"start_time", util::to_iso8601(stats_ptr->started_at())}}},
            {"requests", Json{{"total", stats_ptr->requests()}, {"errors", stats_ptr->errors()}}},
            {"process", Json{{"pid", static_cast<long long>(::getpid())},
                             {"hardware_concurrency", std::thread::hardware_concurrency()}}},
        };

        if (limiter)
        {
            status["rate_limit"] = Json{{"requests_per_minute", limiter->limit()},
                                        {"window_seconds", limiter->window().count() / 1000},
                                        {"tracked_clients", limiter->tracked_clients()}};
        }
        else
        {
            status["rate_limit"] = nullptr;
        }

        return ResourceContent{"status://server", std::string(kJsonMime),
                               util::json::dump_pretty(status)};
    };
    return r;
}

Resource make_logs_resource(const LogBuffer& buffer)
{
    Resource r;
    r.uri = "logs://recent";
    r.name = "Recent Logs";
    r.description = "Recent log entries captured in memory";
    r.mime_type = kJsonMime;

    const auto* buf = &buffer;
    r.provider = [buf](const Json& args)
    {
        const auto count = util::json::value_or<int>(args, "count", 50);
        if (count < 0)
            throw ValidationError("count must not be negative");

        std::optional<LogLevel> min_level;
        if (auto level = util::json::value_or<std::string>(args, "level", ""); !level.empty())
            min_level = log_level_from_string(level);
        const auto contains = util::json::value_or<std::string>(args, "contains", "");

        Json logs = Json::array();
        for (const auto& rec : buf->recent())
        {
            if (min_level && rec.level < *min_level)
                continue;
            if (!contains.empty() && rec.message.find(contains) == std::string::npos)
                continue;
            logs.push_back(to_json(rec));
        }
        // Keep only the newest `count` matches; 0 keeps everything
        if (count > 0 && logs.size() > static_cast<size_t>(count))
            logs.erase(logs.begin(), logs.end() - count);

        Json out = {{"total_captured", buf->size()},
                    {"returned_count", logs.size()},
                    {"max_buffer_size", buf->capacity()},
                    {"logs", logs}};
        return ResourceContent{"logs://recent", std::string(kJsonMime),
                               util::json::dump_pretty(out)};
    };
    return r;
}

} // namespace toolgate::resources
