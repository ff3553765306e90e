#include "toolgate/server/dispatcher.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/server/security_middleware.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace toolgate;
using namespace toolgate::server;

int main()
{
    std::cout << "Running dispatcher tests...\n";

    auto registry = std::make_shared<HandlerRegistry>();
    registry->register_handler("add",
                               [](const Request& r)
                               {
                                   return Response::success(r.arguments.at("a").get<int>() +
                                                            r.arguments.at("b").get<int>());
                               });
    registry->register_handler("explode", [](const Request&) -> Response
                               { throw std::runtime_error("kaboom"); });
    registry->register_handler("weird", [](const Request&) -> Response { throw 42; });
    registry->register_handler("strict", [](const Request&) -> Response
                               { throw ValidationError("a is required"); });
    registry->register_handler("missing_inner", [](const Request&) -> Response
                               { throw NotFoundError("record 7 not found"); });
    registry->register_handler(
        "refuse", [](const Request&) { return Response::failure(ErrorKind::InvalidParams, "no"); });
    registry->register_handler("config://settings",
                               [](const Request&) { return Response::success(Json("cfg")); },
                               HandlerKind::Resource);

    std::vector<std::string> internal_errors;
    std::vector<RequestLogEntry> entries;
    MiddlewarePipeline pipeline;
    pipeline.add(std::make_shared<LoggingMiddleware>(
        [&entries](const RequestLogEntry& e) { entries.push_back(e); }));
    Dispatcher dispatcher(registry, std::move(pipeline),
                          [&internal_errors](const Request& req, const std::string& what)
                          { internal_errors.push_back(req.target + ": " + what); });

    auto make = [](std::string target, Json args = Json::object(),
                   HandlerKind kind = HandlerKind::Tool)
    {
        Request req;
        req.target = std::move(target);
        req.arguments = std::move(args);
        req.kind = kind;
        return req;
    };

    // Success
    {
        auto res = dispatcher.dispatch(make("add", Json{{"a", 2}, {"b", 3}}));
        assert(res.ok());
        assert(res.payload() == 5);
        std::cout << "  [PASS] success\n";
    }

    // Unknown handler is NotFound and never reaches middleware
    {
        entries.clear();
        auto res = dispatcher.dispatch(make("nope"));
        assert(!res.ok());
        assert(res.error().kind == ErrorKind::NotFound);
        assert(res.status() == 404);
        assert(res.error().message == "tool not found: nope");
        assert(res.error().data["name"] == "nope");
        assert(entries.empty());
        std::cout << "  [PASS] unknown handler\n";
    }

    // A resource is not callable as a tool
    {
        auto res = dispatcher.dispatch(make("config://settings"));
        assert(!res.ok() && res.error().kind == ErrorKind::NotFound);
        auto read = dispatcher.dispatch(make("config://settings", Json::object(),
                                             HandlerKind::Resource));
        assert(read.ok() && read.payload() == "cfg");
        std::cout << "  [PASS] kind mismatch\n";
    }

    // Exceptions become error responses
    {
        entries.clear();
        auto res = dispatcher.dispatch(make("explode"));
        assert(!res.ok());
        assert(res.error().kind == ErrorKind::Internal);
        assert(res.error().message == "Internal error: kaboom");
        assert(internal_errors.size() == 1 && internal_errors[0] == "explode: kaboom");
        assert(entries.size() == 1 && entries[0].outcome == "exception");

        res = dispatcher.dispatch(make("weird"));
        assert(res.error().kind == ErrorKind::Internal);
        assert(internal_errors.size() == 2);

        res = dispatcher.dispatch(make("strict"));
        assert(res.error().kind == ErrorKind::InvalidParams);
        assert(res.error().message == "a is required");

        res = dispatcher.dispatch(make("missing_inner"));
        assert(res.error().kind == ErrorKind::NotFound);

        // Bad argument types surface as Internal from nlohmann::json
        res = dispatcher.dispatch(make("add", Json{{"a", "x"}, {"b", 1}}));
        assert(res.error().kind == ErrorKind::Internal);

        res = dispatcher.dispatch(make("refuse"));
        assert(res.error().kind == ErrorKind::InvalidParams && res.status() == 400);
        std::cout << "  [PASS] error conversion\n";
    }

    // Concurrent dispatch over a shared registry
    {
        auto quiet_registry = std::make_shared<HandlerRegistry>();
        quiet_registry->register_handler("square",
                                         [](const Request& r)
                                         {
                                             const int x = r.arguments.at("x").get<int>();
                                             return Response::success(x * x);
                                         });
        Dispatcher quiet(quiet_registry, MiddlewarePipeline{});

        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t)
        {
            threads.emplace_back(
                [&quiet, &failures, t]
                {
                    for (int i = 0; i < 200; ++i)
                    {
                        Request req;
                        req.target = "square";
                        req.arguments = Json{{"x", t * 1000 + i}};
                        auto res = quiet.dispatch(std::move(req));
                        if (!res.ok() || res.payload() != (t * 1000 + i) * (t * 1000 + i))
                            ++failures;
                    }
                });
        }
        for (auto& th : threads)
            th.join();
        assert(failures == 0);
        std::cout << "  [PASS] concurrent dispatch\n";
    }

    std::cout << "All dispatcher tests passed\n";
    return 0;
}
