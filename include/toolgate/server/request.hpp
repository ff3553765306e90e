#pragma once
#include "toolgate/types.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <utility>
#include <variant>

namespace toolgate::server
{

/// Case-insensitive ordering so that "authorization" and "Authorization" name the same entry.
struct CaseInsensitiveLess
{
    bool operator()(const std::string& a, const std::string& b) const
    {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

/// Header-style metadata bag carried by requests and responses
using Metadata = std::map<std::string, std::string, CaseInsensitiveLess>;

/// Error categories reported in-band by the dispatcher
enum class ErrorKind
{
    NotFound,
    InvalidParams,
    Auth,
    RateLimited,
    Internal
};

inline std::string to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::InvalidParams:
        return "invalid_params";
    case ErrorKind::Auth:
        return "auth";
    case ErrorKind::RateLimited:
        return "rate_limited";
    case ErrorKind::Internal:
        return "internal";
    }
    return "internal";
}

/// HTTP-equivalent status for an error kind
inline int status_code(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::NotFound:
        return 404;
    case ErrorKind::InvalidParams:
        return 400;
    case ErrorKind::Auth:
        return 401;
    case ErrorKind::RateLimited:
        return 429;
    case ErrorKind::Internal:
        return 500;
    }
    return 500;
}

/// A single inbound call. Owned by the dispatcher for the duration of the call.
struct Request
{
    std::string target;                   ///< Handler name (tool/prompt) or resource URI
    HandlerKind kind{HandlerKind::Tool};  ///< Expected handler category
    Json arguments = Json::object();      ///< Named arguments
    std::string client{"unknown"};        ///< Client key formed by the transport
    Metadata metadata;                    ///< Incoming headers, writable by middleware
};

struct ErrorInfo
{
    ErrorKind kind{ErrorKind::Internal};
    std::string message;
    Json data = Json::object();
};

/// Result of a call: exactly one of payload or error, plus outgoing headers
class Response
{
  public:
    static Response success(Json payload)
    {
        return Response(Body{std::in_place_index<0>, std::move(payload)});
    }

    static Response failure(ErrorKind kind, std::string message, Json data = Json::object())
    {
        return Response(Body{std::in_place_index<1>, ErrorInfo{kind, std::move(message),
                                                               std::move(data)}});
    }

    bool ok() const
    {
        return body_.index() == 0;
    }

    /// Success payload; throws std::bad_variant_access on an error response
    const Json& payload() const
    {
        return std::get<0>(body_);
    }
    Json& payload()
    {
        return std::get<0>(body_);
    }

    /// Error descriptor; throws std::bad_variant_access on a success response
    const ErrorInfo& error() const
    {
        return std::get<1>(body_);
    }
    ErrorInfo& error()
    {
        return std::get<1>(body_);
    }

    int status() const
    {
        return ok() ? 200 : status_code(error().kind);
    }

    Metadata metadata;

  private:
    using Body = std::variant<Json, ErrorInfo>;

    explicit Response(Body body) : body_(std::move(body)) {}

    Body body_;
};

} // namespace toolgate::server
