#include "toolgate/app.hpp"
#include "toolgate/exceptions.hpp"
#include "toolgate/server/stdio_server.hpp"

#include <algorithm>
#include <iostream>
#include <string>

// Serves the built-in handlers plus one custom tool over stdio.
// Try: echo '{"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"reverse","arguments":{"text":"abc"}}}' | ./toolgate_custom_tool_server

int main() {
  using toolgate::Json;

  toolgate::App app(toolgate::Settings::from_env());
  app.register_builtins();

  app.register_tool(toolgate::tools::Tool(
      "reverse", "Reverse a string",
      Json{{"type", "object"},
           {"properties", Json{{"text", Json{{"type", "string"}}}}},
           {"required", Json::array({"text"})}},
      [](const Json& args) -> Json {
        if (!args.contains("text") || !args["text"].is_string())
          throw toolgate::ValidationError("argument 'text' must be a string");
        auto text = args["text"].get<std::string>();
        std::reverse(text.begin(), text.end());
        return Json{{"success", true}, {"result", text}};
      }));

  toolgate::server::StdioServerWrapper server(app.mcp_handler(), std::cin, std::cout,
                                              &app.logger());
  server.run();
  return 0;
}
