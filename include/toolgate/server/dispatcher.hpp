#pragma once
#include "toolgate/server/handler_registry.hpp"
#include "toolgate/server/middleware_pipeline.hpp"

#include <functional>
#include <memory>
#include <string>

namespace toolgate::server
{

/// Called with a description of every unexpected failure converted to an Internal response
using InternalErrorCallback = std::function<void(const Request& req, const std::string& what)>;

/// Sole entry point from transports into the core.
///
/// dispatch() resolves the target handler, then runs the middleware chain composed once at
/// construction; the innermost stage calls the handler. Every failure becomes an error
/// Response, so dispatch() never throws. The dispatcher keeps no per-request state and may
/// be called concurrently once the registry is fully populated.
class Dispatcher
{
  public:
    Dispatcher(std::shared_ptr<const HandlerRegistry> registry, MiddlewarePipeline pipeline,
               InternalErrorCallback on_internal_error = nullptr);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    Response dispatch(Request request) const;

    const HandlerRegistry& registry() const
    {
        return *registry_;
    }
    const MiddlewarePipeline& pipeline() const
    {
        return pipeline_;
    }

  private:
    Response invoke_handler(Request& req) const;
    Response internal_error(const Request& req, const std::string& what) const;

    std::shared_ptr<const HandlerRegistry> registry_;
    MiddlewarePipeline pipeline_;
    InternalErrorCallback on_internal_error_;
    CallNext chain_;
};

} // namespace toolgate::server
