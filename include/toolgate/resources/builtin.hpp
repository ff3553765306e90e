#pragma once
#include "toolgate/logging.hpp"
#include "toolgate/resources/resource.hpp"
#include "toolgate/server/rate_limiter.hpp"
#include "toolgate/server/stats.hpp"
#include "toolgate/settings.hpp"

#include <memory>

namespace toolgate::resources
{

/// config://settings - the active configuration with the auth token redacted
Resource make_config_resource(const Settings& settings);

/// status://server - uptime, request counters and process information.
/// limiter may be null when rate limiting is disabled.
Resource make_status_resource(const Settings& settings, const server::ServerStats& stats,
                              std::shared_ptr<const server::RateLimiter> limiter);

/// logs://recent - snapshot of the in-memory log buffer.
/// Arguments: count (default 50), level (minimum level), contains (substring filter).
Resource make_logs_resource(const LogBuffer& buffer);

} // namespace toolgate::resources
