#pragma once
#include "toolgate/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolgate
{

struct ServerSettings
{
    std::string host{"127.0.0.1"};
    int port{8000};
};

struct AuthSettings
{
    bool enabled{false};
    std::optional<std::string> token;
};

struct MiddlewareSettings
{
    bool logging_enabled{true};
    bool rate_limiting_enabled{false};
    int requests_per_minute{60};
    /// Outermost first; entries are "auth", "logging", "rate_limit"
    std::vector<std::string> order{"auth", "logging", "rate_limit"};
};

struct ResourceSettings
{
    int max_file_size_mb{10};
    std::vector<std::string> allowed_file_extensions{".txt", ".json", ".md", ".py"};
};

struct Settings
{
    std::string app_name{"toolgate"};
    std::string app_version{"0.1.0"};
    std::string environment{"development"};
    std::string log_level{"INFO"};
    ServerSettings server;
    AuthSettings auth;
    MiddlewareSettings middleware;
    ResourceSettings resources;

    /// Defaults overridden by TOOLGATE_* environment variables
    static Settings from_env();
    /// Apply TOOLGATE_* environment variables on top of base
    static Settings from_env(Settings base);
    static Settings from_json(const Json& j);
    static Settings from_file(const std::string& path);

    /// Serialized view with the auth token redacted
    Json to_json() const;

    /// @throws ValidationError on out-of-range or unknown values
    void validate() const;
};

} // namespace toolgate
