#pragma once

#include "toolgate/logging.hpp"
#include "toolgate/mcp/handler.hpp"
#include "toolgate/prompts/prompt.hpp"
#include "toolgate/resources/resource.hpp"
#include "toolgate/server/dispatcher.hpp"
#include "toolgate/server/rate_limiter.hpp"
#include "toolgate/server/security_middleware.hpp"
#include "toolgate/server/stats.hpp"
#include "toolgate/settings.hpp"
#include "toolgate/tools/tool.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace toolgate
{

/// Collaborators the middleware need beyond the settings
struct MiddlewareDeps
{
    std::shared_ptr<server::RateLimiter> limiter; ///< Required when rate limiting is enabled
    server::LogCallback on_request;               ///< LoggingMiddleware sink
    server::RejectCallback on_reject;             ///< Auth and rate-limit rejections
};

/// Ordered middleware list (outermost first) following settings.middleware.order.
/// Disabled middleware is left out entirely.
/// @throws ValidationError if rate limiting is enabled without a limiter
std::vector<std::shared_ptr<server::Middleware>> build_middleware(const Settings& settings,
                                                                  const MiddlewareDeps& deps);

/// Application root - owns configuration, logging, the handler registry and the dispatcher
///
/// Handlers are registered first; the first call to dispatcher() freezes the registry and
/// composes the middleware chain. Registering after that throws.
///
/// Usage:
/// ```cpp
/// toolgate::App app(toolgate::Settings::from_env());
/// app.register_builtins();
/// toolgate::server::StdioServerWrapper stdio(app.mcp_handler(), std::cin, std::cout,
///                                            &app.logger());
/// stdio.run();
/// ```
class App
{
  public:
    explicit App(Settings settings = Settings{});

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    const Settings& settings() const
    {
        return settings_;
    }
    const Logger& logger() const
    {
        return logger_;
    }
    Logger& logger()
    {
        return logger_;
    }
    const LogBuffer& log_buffer() const
    {
        return log_buffer_;
    }
    const server::ServerStats& stats() const
    {
        return stats_;
    }
    const server::HandlerRegistry& registry() const
    {
        return *registry_;
    }
    /// Null when rate limiting is disabled
    std::shared_ptr<server::RateLimiter> rate_limiter() const
    {
        return limiter_;
    }

    void register_tool(const tools::Tool& tool);
    void register_resource(const resources::Resource& resource);
    void register_prompt(const prompts::Prompt& prompt);

    /// Built-in tools, resources and prompts
    void register_builtins();

    /// Dispatcher over the registered handlers, built on first use
    const server::Dispatcher& dispatcher();

    /// JSON-RPC handler bound to dispatcher(); the App must outlive it
    mcp::MessageHandler mcp_handler();

    mcp::ServerInfo server_info() const;

  private:
    void ensure_mutable() const;
    void on_request(const server::RequestLogEntry& entry);

    Settings settings_;
    LogBuffer log_buffer_;
    Logger logger_;
    server::ServerStats stats_;
    std::shared_ptr<server::HandlerRegistry> registry_;
    std::shared_ptr<server::RateLimiter> limiter_;
    std::unique_ptr<server::Dispatcher> dispatcher_;
    std::once_flag dispatcher_once_;
    std::atomic<bool> frozen_{false};
};

} // namespace toolgate
