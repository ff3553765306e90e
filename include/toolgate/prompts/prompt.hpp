#pragma once
#include "toolgate/server/handler_registry.hpp"
#include "toolgate/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace toolgate::prompts
{

/// Prompt message
struct PromptMessage
{
    std::string role;    // "user", "assistant"
    std::string content; // Message text
};

/// Named prompt template rendered on prompts/get
struct Prompt
{
    std::string name;
    std::optional<std::string> description;
    std::function<std::vector<PromptMessage>(const Json&)> generator;

    server::HandlerInfo info() const
    {
        server::HandlerInfo out;
        out.name = name;
        out.kind = HandlerKind::Prompt;
        out.description = description.value_or("");
        return out;
    }

    server::Handler handler() const
    {
        auto gen = generator;
        auto desc = description;
        return [gen, desc](const server::Request& req)
        {
            Json messages = Json::array();
            if (gen)
            {
                for (const auto& msg : gen(req.arguments))
                    messages.push_back(
                        Json{{"role", msg.role},
                             {"content", Json{{"type", "text"}, {"text", msg.content}}}});
            }
            Json out = {{"messages", messages}};
            if (desc)
                out["description"] = *desc;
            return server::Response::success(std::move(out));
        };
    }

    void register_into(server::HandlerRegistry& registry) const
    {
        registry.register_handler(info(), handler());
    }
};

} // namespace toolgate::prompts
