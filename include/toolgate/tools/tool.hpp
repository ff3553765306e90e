#pragma once
#include "toolgate/server/handler_registry.hpp"
#include "toolgate/types.hpp"

#include <functional>
#include <string>

namespace toolgate::tools
{

/// A named function over JSON arguments, published through the handler registry.
///
/// The function returns the tool's payload. Expected failures are reported inside the
/// payload (e.g. {"success": false, "error": ...}); malformed arguments throw
/// ValidationError, which the dispatcher reports as InvalidParams.
class Tool
{
  public:
    using Fn = std::function<toolgate::Json(const toolgate::Json&)>;

    Tool() = default;

    Tool(std::string name, std::string description, toolgate::Json input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const toolgate::Json& input_schema() const
    {
        return input_schema_;
    }
    toolgate::Json invoke(const toolgate::Json& input) const
    {
        return fn_(input);
    }

    server::HandlerInfo info() const
    {
        server::HandlerInfo out;
        out.name = name_;
        out.kind = HandlerKind::Tool;
        out.description = description_;
        out.input_schema = input_schema_;
        return out;
    }

    /// Adapter to the registry's handler contract
    server::Handler handler() const
    {
        auto fn = fn_;
        return [fn](const server::Request& req)
        { return server::Response::success(fn(req.arguments)); };
    }

    void register_into(server::HandlerRegistry& registry) const
    {
        registry.register_handler(info(), handler());
    }

  private:
    std::string name_;
    std::string description_;
    toolgate::Json input_schema_ = toolgate::Json::object();
    Fn fn_;
};

} // namespace toolgate::tools
