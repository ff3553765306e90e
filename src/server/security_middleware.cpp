#include "toolgate/server/security_middleware.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/util/time.hpp"

#include <iostream>

namespace toolgate::server
{

// AuthMiddleware implementation

Response AuthMiddleware::reject(const Request& req, const std::string& message)
{
    if (on_reject_)
        on_reject_(req, message);

    auto res = Response::failure(ErrorKind::Auth, message);
    res.metadata[HEADER_WWW_AUTHENTICATE] = "Bearer";
    return res;
}

Response AuthMiddleware::operator()(Request& req, const CallNext& call_next)
{
    // No token configured: authentication disabled
    if (!token_)
        return call_next(req);

    static const std::string kPrefix = "Bearer ";

    auto it = req.metadata.find(HEADER_AUTHORIZATION);
    if (it == req.metadata.end() || it->second.compare(0, kPrefix.size(), kPrefix) != 0)
        return reject(req, "Authentication required");

    if (it->second.substr(kPrefix.size()) != *token_)
        return reject(req, "Invalid authentication token");

    return call_next(req);
}

// LoggingMiddleware implementation

LoggingMiddleware::LoggingMiddleware(LogCallback callback) : callback_(std::move(callback))
{
    if (!callback_)
    {
        callback_ = [](const RequestLogEntry& e)
        {
            // Default: print to stderr
            std::cerr << "[toolgate] " << e.handler << " from " << e.client << " - " << e.status
                      << " " << e.outcome << " - " << util::format_seconds(e.elapsed) << std::endl;
        };
    }
}

void LoggingMiddleware::emit(const Request& req, bool success, int status, std::string outcome,
                             std::string error_message,
                             std::chrono::steady_clock::duration elapsed) const
{
    RequestLogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.handler = req.target;
    entry.kind = req.kind;
    entry.client = req.client;
    entry.success = success;
    entry.status = status;
    entry.outcome = std::move(outcome);
    entry.error_message = std::move(error_message);
    entry.elapsed = elapsed;
    callback_(entry);
}

Response LoggingMiddleware::operator()(Request& req, const CallNext& call_next)
{
    const auto start = std::chrono::steady_clock::now();

    try
    {
        auto res = call_next(req);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        res.metadata[HEADER_RESPONSE_TIME] = util::format_seconds(elapsed);
        if (res.ok())
            emit(req, true, res.status(), "ok", std::string(), elapsed);
        else
            emit(req, false, res.status(), to_string(res.error().kind), res.error().message,
                 elapsed);
        return res;
    }
    catch (const std::exception& e)
    {
        emit(req, false, 500, "exception", e.what(), std::chrono::steady_clock::now() - start);
        throw;
    }
    catch (...)
    {
        emit(req, false, 500, "exception", "unknown exception",
             std::chrono::steady_clock::now() - start);
        throw;
    }
}

// RateLimitMiddleware implementation

RateLimitMiddleware::RateLimitMiddleware(std::shared_ptr<RateLimiter> limiter,
                                         RejectCallback on_reject)
    : limiter_(std::move(limiter)), on_reject_(std::move(on_reject))
{
    if (!limiter_)
        throw ValidationError("RateLimitMiddleware requires a RateLimiter");
}

Response RateLimitMiddleware::operator()(Request& req, const CallNext& call_next)
{
    // The limiter lock is released before the handler runs
    const auto decision = limiter_->try_acquire(req.client);

    if (!decision.allowed)
    {
        if (on_reject_)
            on_reject_(req, "Rate limit exceeded for client " + req.client);

        auto res = Response::failure(ErrorKind::RateLimited, "Rate limit exceeded",
                                     Json{{"retry_after", decision.retry_after.count()},
                                          {"limit", decision.limit},
                                          {"reset", decision.reset_epoch_seconds()}});
        res.metadata[HEADER_RATE_LIMIT_LIMIT] = std::to_string(decision.limit);
        res.metadata[HEADER_RATE_LIMIT_REMAINING] = "0";
        res.metadata[HEADER_RATE_LIMIT_RESET] = std::to_string(decision.reset_epoch_seconds());
        res.metadata[HEADER_RETRY_AFTER] = std::to_string(decision.retry_after.count());
        return res;
    }

    auto res = call_next(req);
    res.metadata[HEADER_RATE_LIMIT_LIMIT] = std::to_string(decision.limit);
    res.metadata[HEADER_RATE_LIMIT_REMAINING] = std::to_string(decision.remaining);
    res.metadata[HEADER_RATE_LIMIT_RESET] = std::to_string(decision.reset_epoch_seconds());
    return res;
}

} // namespace toolgate::server
