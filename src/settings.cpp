#include "toolgate/settings.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace toolgate
{

static std::optional<std::string> getenv_opt(const char* key)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return std::nullopt;
}

static bool parse_bool(const std::string& v)
{
    return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on";
}

static int parse_int(const std::string& key, const std::string& v)
{
    try
    {
        size_t pos = 0;
        int out = std::stoi(v, &pos, 10);
        if (pos != v.size())
            throw ValidationError(key + " is not an integer: " + v);
        return out;
    }
    catch (const std::logic_error&)
    {
        throw ValidationError(key + " is not an integer: " + v);
    }
}

Settings Settings::from_env()
{
    return from_env(Settings{});
}

Settings Settings::from_env(Settings s)
{
    if (auto v = getenv_opt("TOOLGATE_APP_NAME"))
        s.app_name = *v;
    if (auto v = getenv_opt("TOOLGATE_ENVIRONMENT"))
        s.environment = *v;
    if (auto v = getenv_opt("TOOLGATE_LOG_LEVEL"))
    {
        auto lvl = *v;
        std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
        s.log_level = lvl;
    }
    if (auto v = getenv_opt("TOOLGATE_HOST"))
        s.server.host = *v;
    if (auto v = getenv_opt("TOOLGATE_PORT"))
        s.server.port = parse_int("TOOLGATE_PORT", *v);
    if (auto v = getenv_opt("TOOLGATE_AUTH_TOKEN"); v && !v->empty())
    {
        s.auth.enabled = true;
        s.auth.token = *v;
    }
    if (auto v = getenv_opt("TOOLGATE_LOGGING_ENABLED"))
        s.middleware.logging_enabled = parse_bool(*v);
    if (auto v = getenv_opt("TOOLGATE_RATE_LIMITING_ENABLED"))
        s.middleware.rate_limiting_enabled = parse_bool(*v);
    if (auto v = getenv_opt("TOOLGATE_REQUESTS_PER_MINUTE"))
        s.middleware.requests_per_minute = parse_int("TOOLGATE_REQUESTS_PER_MINUTE", *v);
    s.validate();
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    try
    {
        if (j.contains("app_name"))
            s.app_name = j.at("app_name").get<std::string>();
        if (j.contains("app_version"))
            s.app_version = j.at("app_version").get<std::string>();
        if (j.contains("environment"))
            s.environment = j.at("environment").get<std::string>();
        if (j.contains("log_level"))
            s.log_level = j.at("log_level").get<std::string>();

        if (j.contains("server"))
        {
            const auto& srv = j.at("server");
            s.server.host = srv.value("host", s.server.host);
            s.server.port = srv.value("port", s.server.port);
        }

        if (j.contains("auth"))
        {
            const auto& auth = j.at("auth");
            s.auth.enabled = auth.value("enabled", s.auth.enabled);
            if (auth.contains("token") && auth["token"].is_string())
                s.auth.token = auth["token"].get<std::string>();
        }

        if (j.contains("middleware"))
        {
            const auto& mw = j.at("middleware");
            s.middleware.logging_enabled = mw.value("logging_enabled", s.middleware.logging_enabled);
            s.middleware.rate_limiting_enabled =
                mw.value("rate_limiting_enabled", s.middleware.rate_limiting_enabled);
            s.middleware.requests_per_minute =
                mw.value("requests_per_minute", s.middleware.requests_per_minute);
            if (mw.contains("order"))
                s.middleware.order = mw.at("order").get<std::vector<std::string>>();
        }

        if (j.contains("resources"))
        {
            const auto& res = j.at("resources");
            s.resources.max_file_size_mb =
                res.value("max_file_size_mb", s.resources.max_file_size_mb);
            if (res.contains("allowed_file_extensions"))
                s.resources.allowed_file_extensions =
                    res.at("allowed_file_extensions").get<std::vector<std::string>>();
        }
    }
    catch (const Json::exception& e)
    {
        throw ValidationError(std::string("invalid settings: ") + e.what());
    }

    s.validate();
    return s;
}

Settings Settings::from_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw NotFoundError("settings file not found: " + path);

    std::stringstream buffer;
    buffer << in.rdbuf();
    try
    {
        return from_json(Json::parse(buffer.str()));
    }
    catch (const Json::parse_error& e)
    {
        throw ValidationError("settings file " + path + " is not valid JSON: " + e.what());
    }
}

Json Settings::to_json() const
{
    return Json{
        {"app", Json{{"name", app_name}, {"version", app_version}, {"environment", environment}}},
        {"server", Json{{"host", server.host}, {"port", server.port}}},
        {"features",
         Json{{"auth_enabled", auth.enabled},
              {"auth_type", auth.enabled ? Json("bearer") : Json()},
              {"logging_enabled", middleware.logging_enabled},
              {"logging_level", log_level},
              {"rate_limiting_enabled", middleware.rate_limiting_enabled},
              {"requests_per_minute", middleware.requests_per_minute},
              {"middleware_order", middleware.order}}},
        {"resources", Json{{"max_file_size_mb", resources.max_file_size_mb},
                           {"allowed_file_extensions", resources.allowed_file_extensions}}},
    };
}

void Settings::validate() const
{
    if (environment != "development" && environment != "staging" && environment != "production")
        throw ValidationError("unknown environment: " + environment);
    log_level_from_string(log_level);
    if (server.port < 0 || server.port > 65535)
        throw ValidationError("server.port out of range: " + std::to_string(server.port));
    if (middleware.requests_per_minute < 0)
        throw ValidationError("middleware.requests_per_minute must not be negative");
    if (resources.max_file_size_mb <= 0)
        throw ValidationError("resources.max_file_size_mb must be positive");
    if (auth.enabled && (!auth.token || auth.token->empty()))
        throw ValidationError("auth.enabled requires auth.token");

    std::vector<std::string> seen;
    for (const auto& name : middleware.order)
    {
        if (name != "auth" && name != "logging" && name != "rate_limit")
            throw ValidationError("unknown middleware in order: " + name);
        if (std::find(seen.begin(), seen.end(), name) != seen.end())
            throw ValidationError("middleware listed twice in order: " + name);
        seen.push_back(name);
    }

    auto ordered = [&seen](const char* name)
    { return std::find(seen.begin(), seen.end(), name) != seen.end(); };
    if (auth.enabled && !ordered("auth"))
        throw ValidationError("auth is enabled but missing from middleware.order");
    if (middleware.logging_enabled && !ordered("logging"))
        throw ValidationError("logging is enabled but missing from middleware.order");
    if (middleware.rate_limiting_enabled && !ordered("rate_limit"))
        throw ValidationError("rate limiting is enabled but missing from middleware.order");
}

} // namespace toolgate
