#ifndef RGMCP_VERSION_HPP
#define RGMCP_VERSION_HPP

#include <string>

namespace rgmcp
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// Name reported in the initialize handshake
constexpr const char* SERVER_NAME = "ripgrep-mcp";

std::string version_string();

} // namespace rgmcp

#endif // RGMCP_VERSION_HPP
