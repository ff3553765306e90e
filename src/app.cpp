#include "toolgate/app.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/prompts/builtin.hpp"
#include "toolgate/resources/builtin.hpp"
#include "toolgate/tools/calculator.hpp"
#include "toolgate/tools/data_processor.hpp"
#include "toolgate/tools/file_operations.hpp"
#include "toolgate/tools/web_scraper.hpp"
#include "toolgate/util/time.hpp"

namespace toolgate
{

std::vector<std::shared_ptr<server::Middleware>> build_middleware(const Settings& settings,
                                                                  const MiddlewareDeps& deps)
{
    std::vector<std::shared_ptr<server::Middleware>> out;
    for (const auto& name : settings.middleware.order)
    {
        if (name == "auth")
        {
            if (settings.auth.enabled)
                out.push_back(
                    std::make_shared<server::AuthMiddleware>(settings.auth.token, deps.on_reject));
        }
        else if (name == "logging")
        {
            if (settings.middleware.logging_enabled)
                out.push_back(std::make_shared<server::LoggingMiddleware>(deps.on_request));
        }
        else if (name == "rate_limit")
        {
            if (settings.middleware.rate_limiting_enabled)
            {
                if (!deps.limiter)
                    throw ValidationError("rate limiting is enabled but no RateLimiter was given");
                out.push_back(
                    std::make_shared<server::RateLimitMiddleware>(deps.limiter, deps.on_reject));
            }
        }
        else
        {
            throw ValidationError("unknown middleware in order: " + name);
        }
    }
    return out;
}

App::App(Settings settings)
    : settings_(std::move(settings)), logger_(settings_.app_name),
      registry_(std::make_shared<server::HandlerRegistry>())
{
    settings_.validate();
    logger_.set_level(log_level_from_string(settings_.log_level));
    logger_.add_sink(stderr_sink());
    logger_.add_sink(log_buffer_.sink());

    if (settings_.middleware.rate_limiting_enabled)
        limiter_ = std::make_shared<server::RateLimiter>(
            static_cast<size_t>(settings_.middleware.requests_per_minute));
}

void App::ensure_mutable() const
{
    if (frozen_)
        throw ValidationError("handlers must be registered before the dispatcher is built");
}

void App::register_tool(const tools::Tool& tool)
{
    ensure_mutable();
    tool.register_into(*registry_);
}

void App::register_resource(const resources::Resource& resource)
{
    ensure_mutable();
    resource.register_into(*registry_);
}

void App::register_prompt(const prompts::Prompt& prompt)
{
    ensure_mutable();
    prompt.register_into(*registry_);
}

void App::register_builtins()
{
    tools::FileAccessPolicy policy;
    policy.max_file_size_bytes =
        static_cast<std::uintmax_t>(settings_.resources.max_file_size_mb) * 1024 * 1024;
    policy.allowed_extensions = settings_.resources.allowed_file_extensions;

    register_tool(tools::make_calculator_tool());
    register_tool(tools::make_expression_tool());
    register_tool(tools::make_data_processor_tool());
    register_tool(tools::make_read_file_tool(policy));
    register_tool(tools::make_write_file_tool(policy));
    register_tool(tools::make_list_directory_tool());
    register_tool(tools::make_web_scraper_tool());
    register_tool(tools::make_fetch_json_tool());

    register_resource(resources::make_config_resource(settings_));
    register_resource(resources::make_status_resource(settings_, stats_, limiter_));
    register_resource(resources::make_logs_resource(log_buffer_));

    register_prompt(prompts::make_coding_assistant_prompt());
    register_prompt(prompts::make_data_analyst_prompt());

    logger_.debug("registered " + std::to_string(registry_->size()) + " built-in handlers");
}

void App::on_request(const server::RequestLogEntry& entry)
{
    stats_.record(entry.success);

    std::string line = to_string(entry.kind) + " " + entry.handler + " from " + entry.client +
                       " - " + std::to_string(entry.status) + " " + entry.outcome + " - " +
                       util::format_seconds(entry.elapsed);
    if (!entry.error_message.empty())
        line += " - " + entry.error_message;

    if (entry.success)
        logger_.log(LogLevel::Info, "toolgate.request", line);
    else if (entry.status >= 500)
        logger_.log(LogLevel::Error, "toolgate.request", line);
    else
        logger_.log(LogLevel::Warning, "toolgate.request", line);
}

const server::Dispatcher& App::dispatcher()
{
    std::call_once(dispatcher_once_,
                   [this]()
                   {
                       frozen_ = true;

                       MiddlewareDeps deps;
                       deps.limiter = limiter_;
                       deps.on_request = [this](const server::RequestLogEntry& e)
                       { on_request(e); };
                       deps.on_reject = [this](const server::Request& req, const std::string& why)
                       {
                           logger_.log(LogLevel::Warning, "toolgate.security",
                                       why + " (" + req.target + " from " + req.client + ")");
                       };

                       server::MiddlewarePipeline pipeline(build_middleware(settings_, deps));
                       auto on_internal = [this](const server::Request& req, const std::string& what)
                       {
                           logger_.log(LogLevel::Error, "toolgate.dispatcher",
                                       req.target + " failed: " + what);
                       };

                       dispatcher_ = std::make_unique<server::Dispatcher>(
                           registry_, std::move(pipeline), std::move(on_internal));

                       std::string names;
                       for (const auto& n : dispatcher_->pipeline().names())
                           names += (names.empty() ? "" : ", ") + n;
                       logger_.info("middleware: [" + names + "], " +
                                    std::to_string(registry_->size()) + " handlers");
                   });
    return *dispatcher_;
}

mcp::MessageHandler App::mcp_handler()
{
    return mcp::make_mcp_handler(dispatcher(), server_info());
}

mcp::ServerInfo App::server_info() const
{
    mcp::ServerInfo info;
    info.name = settings_.app_name;
    info.version = settings_.app_version;
    return info;
}

} // namespace toolgate
