#ifndef RGMCP_HPP
#define RGMCP_HPP

// Main header that includes everything

#include <rgmcp/config.hpp>
#include <rgmcp/errors.hpp>
#include <rgmcp/log.hpp>
#include <rgmcp/sandbox.hpp>
#include <rgmcp/search.hpp>
#include <rgmcp/server.hpp>
#include <rgmcp/types.hpp>
#include <rgmcp/version.hpp>

// MCP protocol layer: argument schema, dispatch and the search tool
#include <rgmcp/mcp/schema.hpp>
#include <rgmcp/mcp/search_tool.hpp>
#include <rgmcp/mcp/server.hpp>

#endif // RGMCP_HPP
