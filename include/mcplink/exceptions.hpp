#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace mcplink
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

struct TransportError : public Error
{
    using Error::Error;
};

/// Spawning the server or opening the connection failed
struct TransportStartError : public TransportError
{
    using TransportError::TransportError;
};

/// initialize / tools/list exchange failed
struct HandshakeError : public TransportError
{
    using TransportError::TransportError;
};

/// Malformed JSON-RPC, or an error object returned by the server
struct ProtocolError : public TransportError
{
    explicit ProtocolError(const std::string& message, std::optional<int> code = std::nullopt)
        : TransportError(message), code_(code)
    {
    }

    std::optional<int> code() const
    {
        return code_;
    }

  private:
    std::optional<int> code_;
};

struct RequestTimeout : public TransportError
{
    using TransportError::TransportError;
};

/// A supervised process exited while it was expected to be running
struct ProcessCrashed : public TransportError
{
    ProcessCrashed(const std::string& message, int exit_code)
        : TransportError(message), exit_code_(exit_code)
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

  private:
    int exit_code_;
};

struct PortUnavailable : public Error
{
    using Error::Error;
};

} // namespace mcplink
