#pragma once
#include "toolgate/server/middleware_pipeline.hpp"
#include "toolgate/server/rate_limiter.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace toolgate::server
{

constexpr const char* HEADER_AUTHORIZATION = "Authorization";
constexpr const char* HEADER_WWW_AUTHENTICATE = "WWW-Authenticate";
constexpr const char* HEADER_RESPONSE_TIME = "X-Response-Time";
constexpr const char* HEADER_RATE_LIMIT_LIMIT = "X-RateLimit-Limit";
constexpr const char* HEADER_RATE_LIMIT_REMAINING = "X-RateLimit-Remaining";
constexpr const char* HEADER_RATE_LIMIT_RESET = "X-RateLimit-Reset";
constexpr const char* HEADER_RETRY_AFTER = "Retry-After";

/// Called when a middleware rejects a request, with a short reason
using RejectCallback = std::function<void(const Request& req, const std::string& reason)>;

/// Bearer token authentication.
///
/// With no token configured every request passes. Otherwise the request metadata must carry
/// "Authorization: Bearer <token>" with an exactly matching token, or the chain is
/// short-circuited with an Auth (401) error. The comparison is a plain string compare; a
/// constant-time compare is the hardening step if tokens become guessable by timing.
class AuthMiddleware : public Middleware
{
  public:
    explicit AuthMiddleware(std::optional<std::string> token, RejectCallback on_reject = nullptr)
        : token_(std::move(token)), on_reject_(std::move(on_reject))
    {
    }

    Response operator()(Request& req, const CallNext& call_next) override;

    std::string name() const override
    {
        return "auth";
    }

  private:
    Response reject(const Request& req, const std::string& message);

    std::optional<std::string> token_;
    RejectCallback on_reject_;
};

/// One record per request passing through LoggingMiddleware
struct RequestLogEntry
{
    std::chrono::system_clock::time_point timestamp;
    std::string handler;
    HandlerKind kind{HandlerKind::Tool};
    std::string client;
    bool success{false};
    int status{200};
    std::string outcome; ///< "ok", an error kind such as "rate_limited", or "exception"
    std::string error_message;
    std::chrono::steady_clock::duration elapsed{};
};

using LogCallback = std::function<void(const RequestLogEntry&)>;

/// Request logging middleware.
///
/// Times the downstream call, emits exactly one RequestLogEntry and adds X-Response-Time to
/// the response metadata. When downstream throws, an "exception" entry is still emitted
/// before the exception continues outward.
///
/// Usage:
/// ```cpp
/// auto logging = std::make_shared<LoggingMiddleware>(
///     [](const RequestLogEntry& e) { std::cerr << e.handler << " " << e.status << "\n"; });
/// pipeline.add(logging);
/// ```
class LoggingMiddleware : public Middleware
{
  public:
    explicit LoggingMiddleware(LogCallback callback = nullptr);

    Response operator()(Request& req, const CallNext& call_next) override;

    std::string name() const override
    {
        return "logging";
    }

  private:
    void emit(const Request& req, bool success, int status, std::string outcome,
              std::string error_message, std::chrono::steady_clock::duration elapsed) const;

    LogCallback callback_;
};

/// Per-client rate limiting on top of a shared RateLimiter.
///
/// The limiter is keyed by Request::client; the transport is responsible for forming a
/// key unique per caller. Denied requests get a RateLimited (429) error with Retry-After
/// and quota headers; admitted requests get the quota headers on their response.
class RateLimitMiddleware : public Middleware
{
  public:
    explicit RateLimitMiddleware(std::shared_ptr<RateLimiter> limiter,
                                 RejectCallback on_reject = nullptr);

    Response operator()(Request& req, const CallNext& call_next) override;

    std::string name() const override
    {
        return "rate_limit";
    }

    const std::shared_ptr<RateLimiter>& limiter() const
    {
        return limiter_;
    }

  private:
    std::shared_ptr<RateLimiter> limiter_;
    RejectCallback on_reject_;
};

} // namespace toolgate::server
