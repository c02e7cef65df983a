#ifndef RGMCP_INTERNAL_UTF8_HPP
#define RGMCP_INTERNAL_UTF8_HPP

#include <string>

namespace rgmcp
{
namespace internal
{

// True if text is well-formed UTF-8 (no overlongs, surrogates or code points above U+10FFFF)
bool is_valid_utf8(const std::string& text);

} // namespace internal
} // namespace rgmcp

#endif // RGMCP_INTERNAL_UTF8_HPP
