#include "toolgate/app.hpp"
#include "toolgate/exceptions.hpp"
#include "toolgate/server/http_server.hpp"
#include "toolgate/server/stdio_server.hpp"
#include "toolgate/version.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace
{

std::atomic<bool> g_stop{false};

extern "C" void handle_signal(int)
{
    g_stop = true;
}

static int usage(int exit_code = 1)
{
    std::cout << "toolgate " << toolgate::VERSION_STRING << "\n";
    std::cout << "Usage:\n";
    std::cout << "  toolgate --help\n";
    std::cout << "  toolgate --version\n";
    std::cout << "  toolgate list [--config <file>]\n";
    std::cout << "  toolgate serve [--stdio | --http] [--host <host>] [--port <port>] "
                 "[--config <file>]\n";
    std::cout << "\n";
    std::cout << "Configuration is read from --config (JSON) and then overridden by\n";
    std::cout << "TOOLGATE_* environment variables (TOOLGATE_PORT, TOOLGATE_AUTH_TOKEN, ...).\n";
    return exit_code;
}

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] != flag)
            continue;
        if (i + 1 >= args.size() || is_flag(args[i + 1]))
            throw std::invalid_argument("missing value for " + flag);
        std::string value = args[i + 1];
        args.erase(args.begin() + static_cast<std::ptrdiff_t>(i),
                   args.begin() + static_cast<std::ptrdiff_t>(i + 2));
        return value;
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<std::ptrdiff_t>(i));
            return true;
        }
    }
    return false;
}

static toolgate::Settings load_settings(std::vector<std::string>& args)
{
    auto config = consume_flag_value(args, "--config");
    toolgate::Settings base = config ? toolgate::Settings::from_file(*config) : toolgate::Settings{};
    return toolgate::Settings::from_env(std::move(base));
}

static int run_list(std::vector<std::string> args)
{
    auto settings = load_settings(args);
    if (!args.empty())
    {
        std::cerr << "Unknown argument: " << args.front() << "\n";
        return usage(2);
    }

    toolgate::App app(std::move(settings));
    app.register_builtins();

    const std::pair<toolgate::HandlerKind, const char*> sections[] = {
        {toolgate::HandlerKind::Tool, "Tools"},
        {toolgate::HandlerKind::Resource, "Resources"},
        {toolgate::HandlerKind::Prompt, "Prompts"},
    };
    for (const auto& [kind, title] : sections)
    {
        std::cout << title << ":\n";
        for (const auto& info : app.registry().entries(kind))
            std::cout << "  " << info.name << " - " << info.description << "\n";
    }
    return 0;
}

static int run_serve(std::vector<std::string> args)
{
    const bool stdio = consume_flag(args, "--stdio");
    const bool http = consume_flag(args, "--http");
    if (stdio && http)
    {
        std::cerr << "--stdio and --http are mutually exclusive\n";
        return usage(2);
    }

    auto settings = load_settings(args);
    if (auto host = consume_flag_value(args, "--host"))
        settings.server.host = *host;
    if (auto port = consume_flag_value(args, "--port"))
        settings.server.port = std::stoi(*port);
    if (!args.empty())
    {
        std::cerr << "Unknown argument: " << args.front() << "\n";
        return usage(2);
    }
    settings.validate();

    toolgate::App app(std::move(settings));
    app.register_builtins();

    const auto& s = app.settings();
    app.logger().info("Starting " + s.app_name + " v" + s.app_version);
    app.logger().info("Environment: " + s.environment);
    app.logger().info(std::string("Auth enabled: ") + (s.auth.enabled ? "true" : "false"));
    app.logger().info(std::string("Rate limiting enabled: ") +
                      (s.middleware.rate_limiting_enabled ? "true" : "false"));

    auto handler = app.mcp_handler();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    if (!http)
    {
        toolgate::server::StdioServerWrapper server(handler, std::cin, std::cout, &app.logger());
        server.run();
        app.logger().info("Shutting down " + s.app_name);
        return 0;
    }

    toolgate::server::HttpServerWrapper server(handler, s.server.host, s.server.port, "",
                                               &app.logger());
    try
    {
        server.start();
    }
    catch (const toolgate::TransportError& e)
    {
        app.logger().error(std::string("Failed to start HTTP server: ") + e.what());
        return 1;
    }

    while (!g_stop && server.running())
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

    app.logger().info("Shutting down " + s.app_name);
    server.stop();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);
    if (cmd == "--version")
    {
        std::cout << "toolgate " << toolgate::VERSION_STRING << "\n";
        return 0;
    }

    std::vector<std::string> rest(argv + 2, argv + argc);
    try
    {
        if (cmd == "list")
            return run_list(std::move(rest));
        if (cmd == "serve")
            return run_serve(std::move(rest));
    }
    catch (const toolgate::Error& e)
    {
        std::cerr << "toolgate: " << e.what() << "\n";
        return 1;
    }
    catch (const std::logic_error& e)
    {
        std::cerr << "toolgate: " << e.what() << "\n";
        return usage(2);
    }

    return usage();
}
