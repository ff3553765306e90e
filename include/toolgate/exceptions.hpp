#pragma once
#include <stdexcept>
#include <string>

namespace toolgate
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct DuplicateNameError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

struct AuthError : public Error
{
    using Error::Error;
};

struct RateLimitError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

} // namespace toolgate
