#pragma once
#include "toolgate/server/dispatcher.hpp"
#include "toolgate/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace toolgate::mcp
{

/// JSON-RPC error codes used on the wire
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
constexpr int AUTH_REQUIRED = -32001;
constexpr int RESOURCE_NOT_FOUND = -32002;
constexpr int RATE_LIMITED = -32029;

/// Published in the initialize result
struct ServerInfo
{
    std::string name;
    std::string version;
    std::optional<std::string> instructions;
};

using MessageHandler = std::function<Json(const Json&)>;

/// JSON-RPC code for a dispatcher error; a missing resource gets RESOURCE_NOT_FOUND
int error_code(server::ErrorKind kind, HandlerKind target_kind);

// Factory that produces a JSON-RPC 2.0 handler over a dispatcher. Supported methods:
// - "initialize", "ping"
// - "tools/list", "tools/call"
// - "resources/list", "resources/read"
// - "prompts/list", "prompts/get"
// Calls are routed through Dispatcher::dispatch, so middleware sees every tools/call,
// resources/read and prompts/get. Client identity and headers are taken from
// params._meta.client and params._meta.headers. Notifications (no "id") yield a null Json.
// Both references must outlive the returned function.
MessageHandler make_mcp_handler(const server::Dispatcher& dispatcher,
                                const server::HandlerRegistry& registry, ServerInfo info);

/// Same as above using dispatcher.registry()
MessageHandler make_mcp_handler(const server::Dispatcher& dispatcher, ServerInfo info);

/// Parse one raw message and run it through handler.
/// Returns the serialized response, or an empty string for notifications.
/// Malformed JSON yields a PARSE_ERROR response.
std::string handle_raw_message(const MessageHandler& handler, const std::string& raw);

/// Headers attached to a JSON-RPC response (result._meta.headers or error.data.headers)
server::Metadata response_headers(const Json& response);

} // namespace toolgate::mcp
