#pragma once
#include <stdexcept>
#include <string>

namespace nanohubmcp
{

/// Base of every error raised by the library. Handlers may throw it (or any
/// std::exception) to report a failure to the caller.
struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// A tool, resource or prompt lookup by name or URI found nothing.
struct NotFoundError : public Error
{
    using Error::Error;
};

/// Rejected input: empty registration names, missing handlers, non-object arguments.
struct ValidationError : public Error
{
    using Error::Error;
};

/// The HTTP listener could not be started.
struct TransportError : public Error
{
    using Error::Error;
};

} // namespace nanohubmcp
