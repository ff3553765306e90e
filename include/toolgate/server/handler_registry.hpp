#pragma once
#include "toolgate/server/request.hpp"
#include "toolgate/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolgate::server
{

/// Handler contract: a synchronous function from Request to Response. Expected domain
/// failures are returned as error responses; anything thrown is treated as internal.
using Handler = std::function<Response(const Request&)>;

/// Introspection data published by tools/list, resources/list and prompts/list
struct HandlerInfo
{
    std::string name;
    HandlerKind kind{HandlerKind::Tool};
    std::string description;
    Json input_schema = Json::object();
    std::optional<std::string> mime_type; ///< Resources only
};

/// Name -> handler map. Populated during startup, read-only afterwards, so lookups need no
/// synchronization once serving has begun.
class HandlerRegistry
{
  public:
    /// Bind a handler under info.name
    /// @throws DuplicateNameError if the name is already bound
    /// @throws ValidationError for an empty name or a null handler
    void register_handler(HandlerInfo info, Handler handler);

    /// Convenience overload for handlers without metadata
    void register_handler(const std::string& name, Handler handler,
                          HandlerKind kind = HandlerKind::Tool)
    {
        HandlerInfo info;
        info.name = name;
        info.kind = kind;
        register_handler(std::move(info), std::move(handler));
    }

    /// @throws NotFoundError if no handler is bound to name
    const Handler& resolve(const std::string& name) const;

    /// Non-throwing lookup; nullptr when absent
    const Handler* find(const std::string& name) const;

    const HandlerInfo& info(const std::string& name) const;

    bool contains(const std::string& name) const
    {
        return entries_.count(name) > 0;
    }

    size_t size() const
    {
        return entries_.size();
    }

    /// Sorted names of all registered handlers
    std::vector<std::string> list() const;

    /// Sorted names of the handlers of one kind
    std::vector<std::string> list(HandlerKind kind) const;

    /// Metadata records of one kind, sorted by name
    std::vector<HandlerInfo> entries(HandlerKind kind) const;

  private:
    struct Entry
    {
        HandlerInfo info;
        Handler handler;
    };

    std::unordered_map<std::string, Entry> entries_;
};

} // namespace toolgate::server
