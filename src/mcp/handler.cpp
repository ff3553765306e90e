#include "toolgate/mcp/handler.hpp"

#include "toolgate/exceptions.hpp"

#include <utility>

namespace toolgate::mcp
{

static Json jsonrpc_error(const Json& id, int code, const std::string& message,
                          const Json& data = Json())
{
    Json error = {{"code", code}, {"message", message}};
    if (!data.is_null())
        error["data"] = data;
    return Json{{"jsonrpc", "2.0"}, {"id", id.is_null() ? Json() : id}, {"error", error}};
}

static Json jsonrpc_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

static Json headers_to_json(const server::Metadata& metadata)
{
    Json out = Json::object();
    for (const auto& [key, value] : metadata)
        out[key] = value;
    return out;
}

// Populate client key and headers from params._meta (set by the transports)
static void apply_meta(const Json& params, server::Request& req)
{
    auto meta = params.find("_meta");
    if (meta == params.end() || !meta->is_object())
        return;

    auto client = meta->find("client");
    if (client != meta->end() && client->is_string() && !client->get<std::string>().empty())
        req.client = client->get<std::string>();

    auto headers = meta->find("headers");
    if (headers != meta->end() && headers->is_object())
    {
        for (auto it = headers->begin(); it != headers->end(); ++it)
            req.metadata[it.key()] = it->is_string() ? it->get<std::string>() : it->dump();
    }
}

static Json error_from_response(const Json& id, const server::Response& res, HandlerKind kind)
{
    const auto& err = res.error();
    Json data = Json{{"kind", to_string(err.kind)}, {"status", res.status()}};
    if (err.data.is_object())
        for (auto it = err.data.begin(); it != err.data.end(); ++it)
            data[it.key()] = *it;
    if (!res.metadata.empty())
        data["headers"] = headers_to_json(res.metadata);
    return jsonrpc_error(id, error_code(err.kind, kind), err.message, data);
}

static void attach_headers(Json& result, const server::Response& res)
{
    if (!res.metadata.empty())
        result["_meta"] = Json{{"headers", headers_to_json(res.metadata)}};
}

// MCP tool result: text content plus structured content
static Json build_tool_result(const Json& payload)
{
    const std::string text = payload.is_string() ? payload.get<std::string>() : payload.dump();
    Json result = {
        {"content", Json::array({Json{{"type", "text"}, {"text", text}}})},
        {"structuredContent", payload.is_object() ? payload : Json{{"result", payload}}},
        {"isError", payload.is_object() && payload.value("success", true) == false},
    };
    return result;
}

int error_code(server::ErrorKind kind, HandlerKind target_kind)
{
    switch (kind)
    {
    case server::ErrorKind::NotFound:
        return target_kind == HandlerKind::Resource ? RESOURCE_NOT_FOUND : METHOD_NOT_FOUND;
    case server::ErrorKind::InvalidParams:
        return INVALID_PARAMS;
    case server::ErrorKind::Auth:
        return AUTH_REQUIRED;
    case server::ErrorKind::RateLimited:
        return RATE_LIMITED;
    case server::ErrorKind::Internal:
        return INTERNAL_ERROR;
    }
    return INTERNAL_ERROR;
}

MessageHandler make_mcp_handler(const server::Dispatcher& dispatcher,
                                const server::HandlerRegistry& registry, ServerInfo info)
{
    return [&dispatcher, &registry, info = std::move(info)](const Json& message) -> Json
    {
        const bool is_notification = !message.is_object() || !message.contains("id");
        const auto id = message.is_object() && message.contains("id") ? message.at("id") : Json();

        try
        {
            if (!message.is_object() || !message.contains("method") ||
                !message.at("method").is_string())
                return is_notification && message.is_object()
                           ? Json()
                           : jsonrpc_error(id, INVALID_REQUEST, "Invalid Request");

            const std::string method = message.at("method").get<std::string>();
            Json params = message.value("params", Json::object());
            if (!params.is_object())
                return jsonrpc_error(id, INVALID_PARAMS, "params must be an object");

            // Client notifications ("notifications/initialized", ...) need no reply
            if (is_notification && method.rfind("notifications/", 0) == 0)
                return Json();

            // Run a call through the dispatcher and shape the result
            auto call = [&](HandlerKind kind, const std::string& target,
                            auto&& shape) -> Json
            {
                server::Request req;
                req.target = target;
                req.kind = kind;
                req.arguments = params.value("arguments", Json::object());
                if (!req.arguments.is_object())
                    return jsonrpc_error(id, INVALID_PARAMS, "arguments must be an object");
                apply_meta(params, req);

                auto res = dispatcher.dispatch(std::move(req));
                if (!res.ok())
                    return error_from_response(id, res, kind);

                Json result = shape(res.payload());
                attach_headers(result, res);
                return jsonrpc_result(id, std::move(result));
            };

            Json response;
            if (method == "initialize")
            {
                Json server_info = {{"name", info.name}, {"version", info.version}};
                Json capabilities = {{"tools", Json::object()},
                                     {"resources", Json::object()},
                                     {"prompts", Json::object()}};
                Json result = {{"protocolVersion", "2024-11-05"},
                               {"capabilities", capabilities},
                               {"serverInfo", server_info}};
                if (info.instructions)
                    result["instructions"] = *info.instructions;
                response = jsonrpc_result(id, std::move(result));
            }
            else if (method == "ping")
            {
                response = jsonrpc_result(id, Json::object());
            }
            else if (method == "tools/list")
            {
                Json tools = Json::array();
                for (const auto& entry : registry.entries(HandlerKind::Tool))
                {
                    Json tool = {{"name", entry.name},
                                 {"inputSchema", entry.input_schema.is_null()
                                                     ? Json::object()
                                                     : entry.input_schema}};
                    if (!entry.description.empty())
                        tool["description"] = entry.description;
                    tools.push_back(tool);
                }
                response = jsonrpc_result(id, Json{{"tools", tools}});
            }
            else if (method == "tools/call")
            {
                const std::string name = params.value("name", "");
                if (name.empty())
                    return is_notification ? Json()
                                           : jsonrpc_error(id, INVALID_PARAMS, "Missing tool name");
                response = call(HandlerKind::Tool, name,
                                [](const Json& payload) { return build_tool_result(payload); });
            }
            else if (method == "resources/list")
            {
                Json resources = Json::array();
                for (const auto& entry : registry.entries(HandlerKind::Resource))
                {
                    Json res = {{"uri", entry.name}, {"name", entry.name}};
                    if (!entry.description.empty())
                        res["description"] = entry.description;
                    if (entry.mime_type)
                        res["mimeType"] = *entry.mime_type;
                    resources.push_back(res);
                }
                response = jsonrpc_result(id, Json{{"resources", resources}});
            }
            else if (method == "resources/read")
            {
                std::string uri = params.value("uri", "");
                if (uri.empty())
                    return is_notification
                               ? Json()
                               : jsonrpc_error(id, INVALID_PARAMS, "Missing resource URI");
                response = call(HandlerKind::Resource, uri, [](const Json& payload)
                                { return Json{{"contents", Json::array({payload})}}; });
            }
            else if (method == "prompts/list")
            {
                Json prompts = Json::array();
                for (const auto& entry : registry.entries(HandlerKind::Prompt))
                {
                    Json prompt = {{"name", entry.name}};
                    if (!entry.description.empty())
                        prompt["description"] = entry.description;
                    prompts.push_back(prompt);
                }
                response = jsonrpc_result(id, Json{{"prompts", prompts}});
            }
            else if (method == "prompts/get")
            {
                const std::string name = params.value("name", "");
                if (name.empty())
                    return is_notification
                               ? Json()
                               : jsonrpc_error(id, INVALID_PARAMS, "Missing prompt name");
                response = call(HandlerKind::Prompt, name, [](const Json& payload) { return payload; });
            }
            else
            {
                response = jsonrpc_error(id, METHOD_NOT_FOUND,
                                         std::string("Method '") + method + "' not found");
            }

            return is_notification ? Json() : response;
        }
        catch (const std::exception& e)
        {
            return is_notification ? Json() : jsonrpc_error(id, INTERNAL_ERROR, e.what());
        }
    };
}

MessageHandler make_mcp_handler(const server::Dispatcher& dispatcher, ServerInfo info)
{
    return make_mcp_handler(dispatcher, dispatcher.registry(), std::move(info));
}

std::string handle_raw_message(const MessageHandler& handler, const std::string& raw)
{
    Json message;
    try
    {
        message = Json::parse(raw);
    }
    catch (const Json::parse_error& e)
    {
        return jsonrpc_error(Json(), PARSE_ERROR, std::string("Parse error: ") + e.what()).dump();
    }

    Json response = handler(message);
    if (response.is_null())
        return std::string();
    return response.dump();
}

server::Metadata response_headers(const Json& response)
{
    server::Metadata out;
    const Json* headers = nullptr;
    if (response.contains("result") && response["result"].is_object() &&
        response["result"].contains("_meta"))
        headers = &response["result"]["_meta"];
    else if (response.contains("error") && response["error"].contains("data") &&
             response["error"]["data"].is_object())
        headers = &response["error"]["data"];

    if (!headers || !headers->contains("headers") || !(*headers)["headers"].is_object())
        return out;

    for (auto it = (*headers)["headers"].begin(); it != (*headers)["headers"].end(); ++it)
        if (it->is_string())
            out[it.key()] = it->get<std::string>();
    return out;
}

} // namespace toolgate::mcp
