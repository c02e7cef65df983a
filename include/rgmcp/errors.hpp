#ifndef RGMCP_ERRORS_HPP
#define RGMCP_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace rgmcp
{

// Base exception
class RgmcpError : public std::runtime_error
{
  public:
    explicit RgmcpError(const std::string& message) : std::runtime_error(message) {}
};

// Underlying filesystem or pipe I/O failed
class IoError : public RgmcpError
{
  public:
    explicit IoError(const std::string& message) : RgmcpError("I/O error: " + message) {}
};

// The search engine reported an error or produced output that could not be decoded
class SearchEngineError : public RgmcpError
{
  public:
    SearchEngineError(const std::string& message, int exit_code)
        : RgmcpError("Search engine error: " + message), exit_code_(exit_code)
    {
    }

    // -1 when the process exited cleanly but its output was unusable
    int exit_code() const
    {
        return exit_code_;
    }

  private:
    int exit_code_;
};

// The search engine could not be started at all
class SpawnError : public RgmcpError
{
  public:
    explicit SpawnError(const std::string& message)
        : RgmcpError("Failed to spawn search engine: " + message)
    {
    }
};

// A requested path resolved outside the root directory
class PathTraversalError : public RgmcpError
{
  public:
    explicit PathTraversalError(const std::string& path)
        : RgmcpError("Path traversal attempt: " + path), path_(path)
    {
    }

    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
};

// A requested path does not exist or cannot be resolved
class InvalidPathError : public RgmcpError
{
  public:
    explicit InvalidPathError(const std::string& path)
        : RgmcpError("Invalid path: " + path), path_(path)
    {
    }

    const std::string& path() const
    {
        return path_;
    }

  private:
    std::string path_;
};

// Startup configuration is unusable
class ConfigError : public RgmcpError
{
  public:
    explicit ConfigError(const std::string& message)
        : RgmcpError("Configuration error: " + message)
    {
    }
};

// ============================================================================
// Protocol errors
// ============================================================================

namespace jsonrpc
{
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
} // namespace jsonrpc

// Malformed or unknown tool invocation
class ProtocolError : public RgmcpError
{
  public:
    ProtocolError(const std::string& message, int code) : RgmcpError(message), code_(code) {}

    // JSON-RPC error code sent back to the client
    int code() const
    {
        return code_;
    }

  private:
    int code_;
};

class UnknownToolError : public ProtocolError
{
  public:
    explicit UnknownToolError(const std::string& tool_name)
        : ProtocolError("Unknown tool: " + tool_name, jsonrpc::INVALID_PARAMS),
          tool_name_(tool_name)
    {
    }

    const std::string& tool_name() const
    {
        return tool_name_;
    }

  private:
    std::string tool_name_;
};

class MissingArgumentsError : public ProtocolError
{
  public:
    MissingArgumentsError()
        : ProtocolError("Missing required arguments for search", jsonrpc::INVALID_PARAMS)
    {
    }
};

class InvalidParamsError : public ProtocolError
{
  public:
    InvalidParamsError(const std::string& field, const std::string& reason)
        : ProtocolError("Invalid parameters: field '" + field + "' " + reason,
                        jsonrpc::INVALID_PARAMS),
          field_(field)
    {
    }

    // Name of the offending argument
    const std::string& field() const
    {
        return field_;
    }

  private:
    std::string field_;
};

// The tool ran but the search failed; reported to the client as a tool error result
class ToolInvocationError : public ProtocolError
{
  public:
    explicit ToolInvocationError(const std::string& reason)
        : ProtocolError("Search failed: " + reason, jsonrpc::INTERNAL_ERROR)
    {
    }
};

} // namespace rgmcp

#endif // RGMCP_ERRORS_HPP
