#include "toolgate/server/dispatcher.hpp"

#include "toolgate/exceptions.hpp"

namespace toolgate::server
{

Dispatcher::Dispatcher(std::shared_ptr<const HandlerRegistry> registry,
                       MiddlewarePipeline pipeline, InternalErrorCallback on_internal_error)
    : registry_(std::move(registry)), pipeline_(std::move(pipeline)),
      on_internal_error_(std::move(on_internal_error))
{
    if (!registry_)
        throw ValidationError("Dispatcher requires a HandlerRegistry");

    chain_ = pipeline_.compose([this](Request& req) { return invoke_handler(req); });
}

Response Dispatcher::invoke_handler(Request& req) const
{
    const Handler* handler = registry_->find(req.target);
    if (!handler)
        return Response::failure(ErrorKind::NotFound, "handler not found: " + req.target);
    return (*handler)(req);
}

Response Dispatcher::internal_error(const Request& req, const std::string& what) const
{
    if (on_internal_error_)
        on_internal_error_(req, what);
    return Response::failure(ErrorKind::Internal, "Internal error: " + what);
}

Response Dispatcher::dispatch(Request request) const
{
    // A tool name is not readable as a resource and vice versa
    if (!registry_->contains(request.target) ||
        registry_->info(request.target).kind != request.kind)
        return Response::failure(ErrorKind::NotFound,
                                 to_string(request.kind) + " not found: " + request.target,
                                 Json{{"name", request.target}});

    try
    {
        return chain_(request);
    }
    catch (const NotFoundError& e)
    {
        return Response::failure(ErrorKind::NotFound, e.what());
    }
    catch (const ValidationError& e)
    {
        return Response::failure(ErrorKind::InvalidParams, e.what());
    }
    catch (const AuthError& e)
    {
        return Response::failure(ErrorKind::Auth, e.what());
    }
    catch (const RateLimitError& e)
    {
        return Response::failure(ErrorKind::RateLimited, e.what());
    }
    catch (const std::exception& e)
    {
        return internal_error(request, e.what());
    }
    catch (...)
    {
        return internal_error(request, "unknown exception");
    }
}

} // namespace toolgate::server
