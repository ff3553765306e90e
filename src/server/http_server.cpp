#include "toolgate/server/http_server.hpp"

#include "toolgate/exceptions.hpp"
#include "toolgate/util/json.hpp"

#include <httplib.h>

namespace toolgate::server
{

namespace
{

constexpr const char* kJsonType = "application/json";

// HTTP status for a JSON-RPC response
int http_status(const Json& response)
{
    if (!response.contains("error"))
        return 200;
    const auto& error = response["error"];
    if (error.contains("data") && error["data"].is_object() && error["data"].contains("status") &&
        error["data"]["status"].is_number_integer())
        return error["data"]["status"].get<int>();

    const int code = error.value("code", 0);
    if (code == mcp::PARSE_ERROR || code == mcp::INVALID_REQUEST)
        return 400;
    return 200;
}

} // namespace

HttpServerWrapper::HttpServerWrapper(mcp::MessageHandler handler, std::string host, int port,
                                     std::string cors_origin, const Logger* logger)
    : handler_(std::move(handler)), host_(std::move(host)), port_(port),
      cors_origin_(std::move(cors_origin)), logger_(logger)
{
}

HttpServerWrapper::~HttpServerWrapper()
{
    stop();
}

std::string HttpServerWrapper::client_key(const httplib::Request& req)
{
    auto session = req.get_header_value(SESSION_HEADER);
    return req.remote_addr + ":" + (session.empty() ? std::string("anonymous") : session);
}

bool HttpServerWrapper::start()
{
    // Idempotent start: return false if already running
    if (running_)
        return false;
    svr_ = std::make_unique<httplib::Server>();

    // Security: Set payload and timeout limits to prevent DoS
    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);                  // 30 second read timeout
    svr_->set_write_timeout(30, 0);                 // 30 second write timeout

    svr_->Get("/health",
              [](const httplib::Request&, httplib::Response& res)
              { res.set_content(Json{{"status", "ok"}}.dump(), kJsonType); });

    if (!cors_origin_.empty())
    {
        svr_->Options("/mcp",
                      [this](const httplib::Request&, httplib::Response& res)
                      {
                          res.set_header("Access-Control-Allow-Origin", cors_origin_);
                          res.set_header("Access-Control-Allow-Methods", "POST, OPTIONS");
                          res.set_header("Access-Control-Allow-Headers",
                                         "Content-Type, Authorization, Mcp-Session-Id");
                          res.status = 204;
                      });
    }

    svr_->Post(
        "/mcp",
        [this](const httplib::Request& req, httplib::Response& res)
        {
            // Security: Only set CORS header if explicitly configured
            if (!cors_origin_.empty())
                res.set_header("Access-Control-Allow-Origin", cors_origin_);

            Json message;
            try
            {
                message = util::json::parse(req.body);
            }
            catch (const Json::parse_error& e)
            {
                res.status = 400;
                res.set_content(
                    Json{{"jsonrpc", "2.0"},
                         {"id", nullptr},
                         {"error", Json{{"code", mcp::PARSE_ERROR},
                                        {"message", std::string("Parse error: ") + e.what()}}}}
                        .dump(),
                    kJsonType);
                return;
            }

            // Transport-derived identity replaces anything the client put in _meta
            if (message.is_object())
            {
                if (!message.contains("params") || message["params"].is_null())
                    message["params"] = Json::object();
                if (message["params"].is_object())
                {
                    Json headers = Json::object();
                    for (const auto& [key, value] : req.headers)
                        headers[key] = value;
                    auto& meta = message["params"]["_meta"];
                    if (!meta.is_object())
                        meta = Json::object();
                    meta["client"] = client_key(req);
                    meta["headers"] = headers;
                }
            }

            Json response;
            try
            {
                response = handler_(message);
            }
            catch (const std::exception& e)
            {
                if (logger_)
                    logger_->error(std::string("http transport: ") + e.what());
                res.status = 500;
                res.set_content(Json{{"jsonrpc", "2.0"},
                                     {"id", message.is_object() ? message.value("id", Json())
                                                                : Json()},
                                     {"error", Json{{"code", mcp::INTERNAL_ERROR},
                                                    {"message", e.what()}}}}
                                    .dump(),
                                kJsonType);
                return;
            }

            // Notification: accepted, nothing to return
            if (response.is_null())
            {
                res.status = 202;
                return;
            }

            for (const auto& [key, value] : mcp::response_headers(response))
                res.set_header(key, value);
            res.status = http_status(response);
            res.set_content(response.dump(), kJsonType);
        });

    const int requested = port_;
    if (port_ == 0)
    {
        port_ = svr_->bind_to_any_port(host_);
        if (port_ <= 0)
            port_ = 0;
    }
    else if (!svr_->bind_to_port(host_, port_))
    {
        port_ = 0;
    }
    if (port_ == 0)
    {
        port_ = requested;
        svr_.reset();
        throw TransportError("http transport: cannot bind " + host_ + ":" +
                             std::to_string(requested));
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });

    if (logger_)
        logger_->info("http transport listening on " + host_ + ":" + std::to_string(port_));
    return true;
}

void HttpServerWrapper::stop()
{
    // Always attempt a graceful shutdown; safe to call multiple times
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
    svr_.reset();
}

} // namespace toolgate::server
