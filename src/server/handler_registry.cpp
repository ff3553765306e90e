#include "toolgate/server/handler_registry.hpp"

#include "toolgate/exceptions.hpp"

#include <algorithm>

namespace toolgate::server
{

void HandlerRegistry::register_handler(HandlerInfo info, Handler handler)
{
    if (info.name.empty())
        throw ValidationError("handler name must not be empty");
    if (!handler)
        throw ValidationError("handler for '" + info.name + "' is empty");
    if (entries_.count(info.name))
        throw DuplicateNameError("handler already registered: " + info.name);

    auto name = info.name;
    entries_.emplace(std::move(name), Entry{std::move(info), std::move(handler)});
}

const Handler& HandlerRegistry::resolve(const std::string& name) const
{
    auto it = entries_.find(name);
    if (it == entries_.end())
        throw NotFoundError("handler not found: " + name);
    return it->second.handler;
}

const Handler* HandlerRegistry::find(const std::string& name) const
{
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second.handler;
}

const HandlerInfo& HandlerRegistry::info(const std::string& name) const
{
    auto it = entries_.find(name);
    if (it == entries_.end())
        throw NotFoundError("handler not found: " + name);
    return it->second.info;
}

std::vector<std::string> HandlerRegistry::list() const
{
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& kv : entries_)
        names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> HandlerRegistry::list(HandlerKind kind) const
{
    std::vector<std::string> names;
    for (const auto& [name, entry] : entries_)
        if (entry.info.kind == kind)
            names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<HandlerInfo> HandlerRegistry::entries(HandlerKind kind) const
{
    std::vector<HandlerInfo> out;
    for (const auto& name : list(kind))
        out.push_back(entries_.at(name).info);
    return out;
}

} // namespace toolgate::server
