#pragma once
#include <nlohmann/json.hpp>

#include <string>

namespace toolgate
{

using Json = nlohmann::json;

/// Category of a registered handler. Tools are invoked, resources are read, prompts are
/// rendered; all three go through the same dispatch path.
enum class HandlerKind
{
    Tool,
    Resource,
    Prompt
};

inline std::string to_string(HandlerKind kind)
{
    switch (kind)
    {
    case HandlerKind::Tool:
        return "tool";
    case HandlerKind::Resource:
        return "resource";
    case HandlerKind::Prompt:
        return "prompt";
    }
    return "tool";
}

} // namespace toolgate
