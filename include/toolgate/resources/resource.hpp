#pragma once
#include "toolgate/server/handler_registry.hpp"
#include "toolgate/types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace toolgate::resources
{

/// Content returned by a resource read operation
struct ResourceContent
{
    std::string uri;
    std::optional<std::string> mime_type;
    std::string text;
};

/// Readable resource addressed by URI, e.g. "status://server"
struct Resource
{
    std::string uri;
    std::string name;                                     // Human-readable name
    std::optional<std::string> description;
    std::optional<std::string> mime_type;                 // MIME type hint
    std::function<ResourceContent(const Json&)> provider; // Content provider function

    server::HandlerInfo info() const
    {
        server::HandlerInfo out;
        out.name = uri;
        out.kind = HandlerKind::Resource;
        out.description = description.value_or(name);
        out.mime_type = mime_type;
        return out;
    }

    server::Handler handler() const
    {
        auto provider_fn = provider;
        auto default_uri = uri;
        auto default_mime = mime_type;
        return [provider_fn, default_uri, default_mime](const server::Request& req)
        {
            ResourceContent content = provider_fn
                                          ? provider_fn(req.arguments)
                                          : ResourceContent{default_uri, default_mime, {}};
            if (content.uri.empty())
                content.uri = default_uri;
            if (!content.mime_type)
                content.mime_type = default_mime;

            Json entry = {{"uri", content.uri}, {"text", content.text}};
            if (content.mime_type)
                entry["mimeType"] = *content.mime_type;
            return server::Response::success(std::move(entry));
        };
    }

    void register_into(server::HandlerRegistry& registry) const
    {
        registry.register_handler(info(), handler());
    }
};

} // namespace toolgate::resources
