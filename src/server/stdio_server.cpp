#include "toolgate/server/stdio_server.hpp"

#include <string>

namespace toolgate::server
{

StdioServerWrapper::StdioServerWrapper(mcp::MessageHandler handler, std::istream& in,
                                       std::ostream& out, const Logger* logger)
    : handler_(std::move(handler)), in_(in), out_(out), logger_(logger)
{
}

StdioServerWrapper::~StdioServerWrapper()
{
    stop();
}

std::string StdioServerWrapper::handle_line(const std::string& line) const
{
    // Tag the message with the transport's client key, replacing anything the client sent
    auto tagged = [this](const Json& message) -> Json
    {
        if (!message.is_object())
            return handler_(message);

        Json copy = message;
        if (!copy.contains("params") || !copy["params"].is_object())
        {
            if (copy.contains("params"))
                return handler_(copy);
            copy["params"] = Json::object();
        }
        auto& meta = copy["params"]["_meta"];
        if (!meta.is_object())
            meta = Json::object();
        meta["client"] = CLIENT_KEY;
        return handler_(copy);
    };
    return mcp::handle_raw_message(tagged, line);
}

void StdioServerWrapper::run_loop()
{
    if (logger_)
        logger_->info("stdio transport started");

    std::string line;
    while (running_ && !stop_requested_ && std::getline(in_, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        // Skip empty lines
        if (line.empty())
            continue;

        std::string response;
        try
        {
            response = handle_line(line);
        }
        catch (const std::exception& e)
        {
            if (logger_)
                logger_->error(std::string("stdio transport: ") + e.what());
            response = Json{{"jsonrpc", "2.0"},
                            {"id", nullptr},
                            {"error", Json{{"code", mcp::INTERNAL_ERROR}, {"message", e.what()}}}}
                           .dump();
        }

        if (response.empty())
            continue;
        // Write JSON-RPC response (line-delimited)
        out_ << response << std::endl;
    }

    if (logger_)
        logger_->info("stdio transport stopped");
    running_ = false;
}

bool StdioServerWrapper::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    run_loop();

    return true;
}

bool StdioServerWrapper::start_async()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;

    thread_ = std::thread([this]() { run_loop(); });

    return true;
}

void StdioServerWrapper::stop()
{
    stop_requested_ = true;

    // If running in background thread, join it
    if (thread_.joinable())
        thread_.join();

    running_ = false;
}

} // namespace toolgate::server
