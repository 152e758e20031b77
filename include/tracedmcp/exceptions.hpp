#pragma once
#include <stdexcept>
#include <string>

namespace tracedmcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

/// Raised when a span is mutated after end().
struct SpanStateError : public Error
{
    using Error::Error;
};

} // namespace tracedmcp
