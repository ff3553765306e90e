#pragma once
#include "toolgate/logging.hpp"
#include "toolgate/mcp/handler.hpp"

#include <atomic>
#include <functional>
#include <iostream>
#include <thread>

namespace toolgate::server
{

/**
 * STDIO transport for line-delimited JSON-RPC communication.
 *
 * Reads one JSON-RPC message per line from the input stream and writes one response per
 * line to the output stream. Every message is tagged with the client key "stdio" in
 * params._meta.client before it reaches the handler. Notifications produce no output.
 *
 * Usage:
 *   auto handler = toolgate::mcp::make_mcp_handler(dispatcher, {"toolgate", "0.1.0"});
 *   StdioServerWrapper server(handler);
 *   server.run();  // Blocking - runs until EOF or stop() is called
 *
 * Diagnostics go to the optional logger, never to the output stream.
 */
class StdioServerWrapper
{
  public:
    static constexpr const char* CLIENT_KEY = "stdio";

    explicit StdioServerWrapper(mcp::MessageHandler handler, std::istream& in = std::cin,
                                std::ostream& out = std::cout, const Logger* logger = nullptr);

    ~StdioServerWrapper();

    /**
     * Start the server (blocking mode).
     *
     * Runs until EOF on the input stream or until stop() is called from another thread.
     * A pending blocking read is not interrupted by stop().
     *
     * @return true if the server ran, false if it was already running
     */
    bool run();

    /**
     * Start the server in a background thread. Use stop() to terminate.
     */
    bool start_async();

    /**
     * Signal the loop to stop and join the background thread if any.
     * Safe to call multiple times.
     */
    void stop();

    bool running() const
    {
        return running_.load();
    }

    /// Process one raw line; returns the serialized response or "" for notifications
    std::string handle_line(const std::string& line) const;

  private:
    void run_loop();

    mcp::MessageHandler handler_;
    std::istream& in_;
    std::ostream& out_;
    const Logger* logger_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread thread_;
};

} // namespace toolgate::server
