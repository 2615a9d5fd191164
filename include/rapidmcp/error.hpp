#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace rapidmcp {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class McpParseError : public McpError {
public:
    using McpError::McpError;
};

class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// A command set that cannot form a registry (duplicate name, bad parameter, ...).
class RegistryError : public McpError {
public:
    using McpError::McpError;
};

/// A command file that cannot be read or parsed.
class LoadError : public McpError {
public:
    std::string path;
    LoadError(std::string path, const std::string& msg)
        : McpError(path + ": " + msg), path(std::move(path)) {}
};

class TemplateError : public McpError {
public:
    using McpError::McpError;
};

class ConfigError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace rapidmcp
