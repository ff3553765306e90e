#include "toolgate/server/middleware_pipeline.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace toolgate;
using namespace toolgate::server;

namespace
{

/// Records entry and exit around call_next
class TraceMiddleware : public Middleware
{
  public:
    TraceMiddleware(std::string name, std::vector<std::string>& trace)
        : name_(std::move(name)), trace_(trace)
    {
    }

    std::string name() const override
    {
        return name_;
    }

  protected:
    Response on_request(Request& req, const CallNext& call_next) override
    {
        trace_.push_back(name_ + ":before");
        auto res = call_next(req);
        trace_.push_back(name_ + ":after");
        res.metadata["X-Last"] = name_;
        return res;
    }

  private:
    std::string name_;
    std::vector<std::string>& trace_;
};

/// Rejects without calling the rest of the chain
class BlockMiddleware : public Middleware
{
  public:
    Response operator()(Request&, const CallNext&) override
    {
        return Response::failure(ErrorKind::Auth, "blocked");
    }
};

/// Counts kind-specific hook invocations
class KindCounter : public Middleware
{
  public:
    int tools = 0, resources = 0, prompts = 0;

  protected:
    Response on_call_tool(Request& req, const CallNext& next) override
    {
        ++tools;
        return next(req);
    }
    Response on_read_resource(Request& req, const CallNext& next) override
    {
        ++resources;
        return next(req);
    }
    Response on_get_prompt(Request& req, const CallNext& next) override
    {
        ++prompts;
        return next(req);
    }
};

} // namespace

int main()
{
    std::cout << "Running middleware pipeline tests...\n";

    // Onion order: first added sees the request first and the response last
    {
        std::vector<std::string> trace;
        MiddlewarePipeline pipeline;
        pipeline.add(std::make_shared<TraceMiddleware>("a", trace));
        pipeline.add(std::make_shared<TraceMiddleware>("b", trace));

        auto chain = pipeline.compose(
            [&trace](Request&)
            {
                trace.push_back("handler");
                return Response::success(Json{{"ok", true}});
            });

        Request req;
        auto res = chain(req);
        assert(res.ok());
        assert(res.metadata["X-Last"] == "a");
        const std::vector<std::string> expected = {"a:before", "b:before", "handler", "b:after",
                                                   "a:after"};
        assert(trace == expected);
        assert((pipeline.names() == std::vector<std::string>{"a", "b"}));
        std::cout << "  [PASS] onion ordering\n";
    }

    // Short-circuit: later stages and the handler never run
    {
        std::vector<std::string> trace;
        MiddlewarePipeline pipeline;
        pipeline.add(std::make_shared<TraceMiddleware>("outer", trace));
        pipeline.add(std::make_shared<BlockMiddleware>());
        pipeline.add(std::make_shared<TraceMiddleware>("inner", trace));

        bool handler_called = false;
        Request req;
        auto res = pipeline.execute(req,
                                    [&handler_called](Request&)
                                    {
                                        handler_called = true;
                                        return Response::success(Json::object());
                                    });
        assert(!res.ok());
        assert(res.error().kind == ErrorKind::Auth);
        assert(res.status() == 401);
        assert(!handler_called);
        assert((trace == std::vector<std::string>{"outer:before", "outer:after"}));
        std::cout << "  [PASS] short-circuit\n";
    }

    // Empty pipeline is the handler itself
    {
        MiddlewarePipeline pipeline;
        assert(pipeline.empty());
        Request req;
        req.arguments = Json{{"x", 1}};
        auto res = pipeline.execute(req, [](Request& r) { return Response::success(r.arguments); });
        assert(res.ok());
        assert(res.payload()["x"] == 1);
        std::cout << "  [PASS] empty pipeline\n";
    }

    // Kind-specific hooks
    {
        auto counter = std::make_shared<KindCounter>();
        MiddlewarePipeline pipeline({counter});
        auto chain = pipeline.compose([](Request&) { return Response::success(Json()); });

        for (auto kind : {HandlerKind::Tool, HandlerKind::Tool, HandlerKind::Resource,
                          HandlerKind::Prompt})
        {
            Request req;
            req.kind = kind;
            chain(req);
        }
        assert(counter->tools == 2);
        assert(counter->resources == 1);
        assert(counter->prompts == 1);
        std::cout << "  [PASS] kind hooks\n";
    }

    // Metadata keys are case-insensitive
    {
        Request req;
        req.metadata["authorization"] = "Bearer x";
        assert(req.metadata.count("Authorization") == 1);
        assert(req.metadata["AUTHORIZATION"] == "Bearer x");
        std::cout << "  [PASS] case-insensitive metadata\n";
    }

    std::cout << "All middleware pipeline tests passed\n";
    return 0;
}
