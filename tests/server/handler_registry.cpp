#include "toolgate/server/handler_registry.hpp"

#include "toolgate/exceptions.hpp"

#include <cassert>
#include <string>
#include <vector>

using namespace toolgate;
using namespace toolgate::server;

int main()
{
    HandlerRegistry registry;
    auto ok = [](const Request&) { return Response::success(Json::object()); };

    HandlerInfo info;
    info.name = "calculate";
    info.description = "math";
    info.input_schema = Json{{"type", "object"}};
    registry.register_handler(info, ok);
    registry.register_handler("b_tool", ok);
    registry.register_handler("status://server", ok, HandlerKind::Resource);
    registry.register_handler("coding_assistant", ok, HandlerKind::Prompt);

    assert(registry.size() == 4);
    assert(registry.contains("calculate"));
    assert(!registry.contains("missing"));
    assert(registry.find("missing") == nullptr);
    assert(registry.find("calculate") != nullptr);

    // Duplicate names are rejected and the original binding survives
    bool duplicate = false;
    try
    {
        registry.register_handler("calculate",
                                  [](const Request&) { return Response::success(Json(1)); });
    }
    catch (const DuplicateNameError&)
    {
        duplicate = true;
    }
    assert(duplicate);
    assert(registry.info("calculate").description == "math");

    // Empty names and null handlers
    bool empty_name = false;
    try
    {
        registry.register_handler("", ok);
    }
    catch (const ValidationError&)
    {
        empty_name = true;
    }
    assert(empty_name);

    bool null_handler = false;
    try
    {
        registry.register_handler("null", Handler{});
    }
    catch (const ValidationError&)
    {
        null_handler = true;
    }
    assert(null_handler);

    // resolve throws NotFoundError
    bool not_found = false;
    try
    {
        registry.resolve("missing");
    }
    catch (const NotFoundError&)
    {
        not_found = true;
    }
    assert(not_found);
    assert(registry.resolve("b_tool")(Request{}).ok());

    // Listings are sorted and filtered by kind
    assert((registry.list() == std::vector<std::string>{"b_tool", "calculate", "coding_assistant",
                                                        "status://server"}));
    assert((registry.list(HandlerKind::Tool) == std::vector<std::string>{"b_tool", "calculate"}));
    auto resources = registry.entries(HandlerKind::Resource);
    assert(resources.size() == 1 && resources[0].name == "status://server");
    assert(resources[0].kind == HandlerKind::Resource);
    assert(registry.entries(HandlerKind::Prompt).size() == 1);

    return 0;
}
