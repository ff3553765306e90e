#pragma once
#include "toolgate/logging.hpp"
#include "toolgate/mcp/handler.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib
{
class Server;
struct Request;
} // namespace httplib

namespace toolgate::server
{

/**
 * HTTP transport carrying JSON-RPC over POST /mcp.
 *
 * Each request is tagged with a client key of "<remote address>:<Mcp-Session-Id>", or
 * "<remote address>:anonymous" without a session header, and all request headers are passed
 * to the handler as metadata. Response metadata becomes HTTP response headers and the HTTP
 * status follows the error kind (401, 429, ...). GET /health reports liveness.
 */
class HttpServerWrapper
{
  public:
    static constexpr const char* SESSION_HEADER = "Mcp-Session-Id";

    /**
     * @param handler JSON-RPC handler, usually from mcp::make_mcp_handler
     * @param host Host address to bind to
     * @param port Port to listen on (0 picks a free port, see port() after start())
     * @param cors_origin CORS origin to allow (empty = no CORS header, "*" for wildcard)
     * @param logger Optional logger for lifecycle and transport errors
     */
    HttpServerWrapper(mcp::MessageHandler handler, std::string host = "127.0.0.1",
                      int port = 8000, std::string cors_origin = "",
                      const Logger* logger = nullptr);
    ~HttpServerWrapper();

    /// Bind and start serving on a background thread
    /// @return false if already running
    /// @throws TransportError if the address could not be bound
    bool start();
    void stop();
    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }

    /// Client key for an incoming request
    static std::string client_key(const httplib::Request& req);

  private:
    mcp::MessageHandler handler_;
    std::string host_;
    int port_;
    std::string cors_origin_; // Optional CORS origin (empty = no CORS)
    const Logger* logger_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace toolgate::server
