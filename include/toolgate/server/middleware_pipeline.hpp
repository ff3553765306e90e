#pragma once
/// @file middleware_pipeline.hpp
/// @brief Composable request middleware for toolgate
///
/// Provides:
/// - Middleware base class with per-kind virtual hooks
/// - MiddlewarePipeline, an ordered list folded into one nested callable
///
/// The first middleware added is the outermost wrapper: it sees the request first and the
/// response last.

#include "toolgate/server/request.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace toolgate::server
{

/// CallNext function type - invokes the next middleware or the terminal handler
using CallNext = std::function<Response(Request&)>;

/// Base middleware class. A middleware calls call_next at most once; not calling it
/// short-circuits the chain and its own response is returned to the outer stages.
class Middleware
{
  public:
    virtual ~Middleware() = default;

    /// Main entry point - wraps call_next with this middleware's logic
    virtual Response operator()(Request& req, const CallNext& call_next)
    {
        return dispatch(req, call_next);
    }

    /// Short identifier used in configuration and diagnostics
    virtual std::string name() const
    {
        return "middleware";
    }

  protected:
    /// Dispatch to the hook matching the request kind
    virtual Response dispatch(Request& req, const CallNext& call_next)
    {
        switch (req.kind)
        {
        case HandlerKind::Tool:
            return on_call_tool(req, call_next);
        case HandlerKind::Resource:
            return on_read_resource(req, call_next);
        case HandlerKind::Prompt:
            return on_get_prompt(req, call_next);
        }
        return on_request(req, call_next);
    }

    virtual Response on_request(Request& req, const CallNext& call_next)
    {
        return call_next(req);
    }

    // Kind-specific hooks (all default to the generic hook)
    virtual Response on_call_tool(Request& req, const CallNext& call_next)
    {
        return on_request(req, call_next);
    }

    virtual Response on_read_resource(Request& req, const CallNext& call_next)
    {
        return on_request(req, call_next);
    }

    virtual Response on_get_prompt(Request& req, const CallNext& call_next)
    {
        return on_request(req, call_next);
    }
};

/// Middleware pipeline - chains multiple middleware together
class MiddlewarePipeline
{
  public:
    MiddlewarePipeline() = default;
    explicit MiddlewarePipeline(std::vector<std::shared_ptr<Middleware>> middleware)
        : middleware_(std::move(middleware))
    {
    }

    /// Add middleware to the pipeline (executed in order added)
    void add(std::shared_ptr<Middleware> mw)
    {
        middleware_.push_back(std::move(mw));
    }

    /// Fold the middleware list around a terminal stage.
    /// compose({m1, m2}, h)(req) == m1(req, [&](r){ return m2(r, h); })
    CallNext compose(CallNext terminal) const
    {
        // Build chain in reverse order so first-added executes first
        CallNext chain = std::move(terminal);

        for (auto it = middleware_.rbegin(); it != middleware_.rend(); ++it)
        {
            auto mw = *it;
            chain = [mw, next = std::move(chain)](Request& r) { return (*mw)(r, next); };
        }

        return chain;
    }

    /// One-off execution; prefer compose() once and reuse the result
    Response execute(Request& req, CallNext terminal) const
    {
        return compose(std::move(terminal))(req);
    }

    const std::vector<std::shared_ptr<Middleware>>& middleware() const
    {
        return middleware_;
    }

    /// Names in execution order, outermost first
    std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        out.reserve(middleware_.size());
        for (const auto& mw : middleware_)
            out.push_back(mw->name());
        return out;
    }

    bool empty() const
    {
        return middleware_.empty();
    }
    size_t size() const
    {
        return middleware_.size();
    }

  private:
    std::vector<std::shared_ptr<Middleware>> middleware_;
};

} // namespace toolgate::server
