#pragma once
#include <stdexcept>
#include <string>

namespace mdmcp {

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int ConversionFailed = -32000;
} // namespace error

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Frame could not be decoded into a JSON-RPC message.
class McpParseError : public McpError {
public:
    int code;
    explicit McpParseError(const std::string& msg, int code = error::ParseError)
        : McpError(msg), code(code) {}
};

class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

/// Missing or mistyped request field.
class ValidationError : public McpProtocolError {
public:
    explicit ValidationError(const std::string& msg)
        : McpProtocolError(error::InvalidParams, msg) {}
};

class UnknownCapabilityError : public McpProtocolError {
public:
    explicit UnknownCapabilityError(const std::string& id)
        : McpProtocolError(error::InvalidParams, "Unknown tool: " + id) {}
};

/// The conversion collaborator failed.
class ConversionError : public McpProtocolError {
public:
    explicit ConversionError(const std::string& msg)
        : McpProtocolError(error::ConversionFailed, msg) {}
};

/// A frame other than the handshake arrived on an uninitialized session.
class ProtocolSequenceError : public McpProtocolError {
public:
    explicit ProtocolSequenceError(const std::string& msg)
        : McpProtocolError(error::InvalidRequest, msg) {}
};

class DuplicateCapabilityError : public McpError {
public:
    explicit DuplicateCapabilityError(const std::string& id)
        : McpError("Capability already registered: " + id) {}
};

class UnknownSessionTokenError : public McpError {
public:
    explicit UnknownSessionTokenError(const std::string& token)
        : McpError("Could not find session: " + token) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// Invalid command line.
class UsageError : public McpError {
public:
    using McpError::McpError;
};

} // namespace mdmcp
