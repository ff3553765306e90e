#include "toolgate/server/security_middleware.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/server/dispatcher.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace toolgate;
using namespace toolgate::server;
using namespace std::chrono_literals;

namespace
{

Response echo(Request& req)
{
    return Response::success(Json{{"client", req.client}});
}

Request tool_request(const std::string& client = "c1")
{
    Request req;
    req.target = "echo";
    req.client = client;
    return req;
}

} // namespace

int main()
{
    std::cout << "Running security middleware tests...\n";

    // Test 1: AuthMiddleware
    {
        std::cout << "Test: AuthMiddleware validates bearer tokens...\n";

        std::vector<std::string> rejections;
        MiddlewarePipeline pipeline;
        pipeline.add(std::make_shared<AuthMiddleware>(
            std::string("abc"),
            [&rejections](const Request&, const std::string& why) { rejections.push_back(why); }));
        auto chain = pipeline.compose(echo);

        auto ok_req = tool_request();
        ok_req.metadata["authorization"] = "Bearer abc";
        auto ok = chain(ok_req);
        assert(ok.ok());

        auto missing = tool_request();
        auto res = chain(missing);
        assert(!res.ok());
        assert(res.status() == 401);
        assert(res.error().message == "Authentication required");
        assert(res.metadata["WWW-Authenticate"] == "Bearer");

        auto wrong = tool_request();
        wrong.metadata[HEADER_AUTHORIZATION] = "Bearer xyz";
        res = chain(wrong);
        assert(!res.ok());
        assert(res.error().kind == ErrorKind::Auth);
        assert(res.error().message == "Invalid authentication token");

        auto basic = tool_request();
        basic.metadata[HEADER_AUTHORIZATION] = "Basic abc";
        assert(chain(basic).status() == 401);

        assert(rejections.size() == 3);

        // No token configured: everything passes
        MiddlewarePipeline open;
        open.add(std::make_shared<AuthMiddleware>(std::nullopt));
        auto anon = tool_request();
        assert(open.execute(anon, echo).ok());

        std::cout << "  [PASS] AuthMiddleware\n";
    }

    // Test 2: LoggingMiddleware emits one entry per request, including short-circuits
    {
        std::cout << "Test: LoggingMiddleware records outcomes...\n";

        std::vector<RequestLogEntry> entries;
        auto logging = std::make_shared<LoggingMiddleware>(
            [&entries](const RequestLogEntry& e) { entries.push_back(e); });

        // Logging outside auth sees the rejection
        MiddlewarePipeline pipeline;
        pipeline.add(logging);
        pipeline.add(std::make_shared<AuthMiddleware>(std::string("abc")));
        auto chain = pipeline.compose(echo);

        auto good = tool_request("alice");
        good.metadata[HEADER_AUTHORIZATION] = "Bearer abc";
        auto res = chain(good);
        assert(res.ok());
        assert(res.metadata.count(HEADER_RESPONSE_TIME) == 1);

        auto bad = tool_request("mallory");
        res = chain(bad);
        assert(!res.ok());

        assert(entries.size() == 2);
        assert(entries[0].success && entries[0].status == 200 && entries[0].outcome == "ok");
        assert(entries[0].client == "alice" && entries[0].handler == "echo");
        assert(!entries[1].success && entries[1].status == 401 && entries[1].outcome == "auth");
        assert(entries[1].error_message == "Authentication required");

        // Exceptions are logged and rethrown
        entries.clear();
        MiddlewarePipeline throwing;
        throwing.add(logging);
        auto req = tool_request();
        bool rethrown = false;
        try
        {
            throwing.execute(req, [](Request&) -> Response { throw std::runtime_error("boom"); });
        }
        catch (const std::runtime_error&)
        {
            rethrown = true;
        }
        assert(rethrown);
        assert(entries.size() == 1);
        assert(entries[0].outcome == "exception" && entries[0].status == 500);
        assert(entries[0].error_message == "boom");

        std::cout << "  [PASS] LoggingMiddleware\n";
    }

    // Test 3: RateLimitMiddleware, 61 requests in one minute at 60 rpm
    {
        std::cout << "Test: RateLimitMiddleware enforces the per-client limit...\n";

        RateLimiter::TimePoint now{std::chrono::seconds(1'700'000'000)};
        auto limiter = std::make_shared<RateLimiter>(60, [&now] { return now; });
        std::vector<std::string> rejections;
        MiddlewarePipeline pipeline;
        pipeline.add(std::make_shared<RateLimitMiddleware>(
            limiter, [&rejections](const Request&, const std::string& why)
            { rejections.push_back(why); }));
        auto chain = pipeline.compose(echo);

        for (int i = 0; i < 60; ++i)
        {
            auto req = tool_request("10.0.0.1:s1");
            auto res = chain(req);
            assert(res.ok());
            assert(res.metadata[HEADER_RATE_LIMIT_LIMIT] == "60");
            assert(res.metadata[HEADER_RATE_LIMIT_REMAINING] == std::to_string(59 - i));
            now += 500ms;
        }

        auto req = tool_request("10.0.0.1:s1");
        auto res = chain(req);
        assert(!res.ok());
        assert(res.status() == 429);
        assert(res.error().kind == ErrorKind::RateLimited);
        assert(res.error().message == "Rate limit exceeded");
        assert(res.metadata[HEADER_RATE_LIMIT_REMAINING] == "0");
        assert(res.metadata[HEADER_RETRY_AFTER] == "30");
        assert(res.error().data["retry_after"].get<long long>() > 0);
        assert(res.error().data["limit"] == 60);
        assert(res.metadata[HEADER_RATE_LIMIT_RESET] == "1700000060");
        assert(rejections.size() == 1);

        // Another client is unaffected
        auto other = tool_request("10.0.0.2:s1");
        assert(chain(other).ok());

        // Null limiter is a configuration error
        bool threw = false;
        try
        {
            RateLimitMiddleware invalid(nullptr);
        }
        catch (const ValidationError&)
        {
            threw = true;
        }
        assert(threw);

        std::cout << "  [PASS] RateLimitMiddleware\n";
    }

    // Test 4: Full default order through a dispatcher
    {
        std::cout << "Test: auth -> logging -> rate_limit through the dispatcher...\n";

        auto registry = std::make_shared<HandlerRegistry>();
        registry->register_handler("echo",
                                   [](const Request& r)
                                   { return Response::success(Json{{"client", r.client}}); });

        std::vector<RequestLogEntry> entries;
        auto limiter = std::make_shared<RateLimiter>(1);
        MiddlewarePipeline pipeline;
        pipeline.add(std::make_shared<AuthMiddleware>(std::string("abc")));
        pipeline.add(std::make_shared<LoggingMiddleware>(
            [&entries](const RequestLogEntry& e) { entries.push_back(e); }));
        pipeline.add(std::make_shared<RateLimitMiddleware>(limiter));
        Dispatcher dispatcher(registry, std::move(pipeline));

        auto authed = [] {
            auto r = tool_request("k");
            r.metadata[HEADER_AUTHORIZATION] = "Bearer abc";
            return r;
        };

        assert(dispatcher.dispatch(authed()).ok());
        assert(dispatcher.dispatch(authed()).status() == 429);
        // Unauthenticated: rejected before logging or the limiter see it
        assert(dispatcher.dispatch(tool_request("k")).status() == 401);
        assert(entries.size() == 2);
        assert(entries[1].outcome == "rate_limited");
        std::cout << "  [PASS] default order\n";
    }

    std::cout << "All security middleware tests passed\n";
    return 0;
}
