#include "utf8.hpp"

namespace rgmcp
{
namespace internal
{

namespace
{

// Number of bytes in a sequence starting with this lead byte (1-4), or 0 if invalid.
unsigned lead_length(unsigned char byte)
{
    if (byte < 0x80u)
        return 1;
    if (byte >= 0xC2u && byte <= 0xDFu)
        return 2;
    if (byte >= 0xE0u && byte <= 0xEFu)
        return 3;
    if (byte >= 0xF0u && byte <= 0xF4u)
        return 4;
    return 0;
}

bool is_continuation(unsigned char byte)
{
    return (byte & 0xC0u) == 0x80u;
}

} // namespace

bool is_valid_utf8(const std::string& text)
{
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    const auto* end = p + text.size();

    while (p < end)
    {
        unsigned length = lead_length(*p);
        if (length == 0 || static_cast<size_t>(end - p) < length)
            return false;

        for (unsigned i = 1; i < length; ++i)
            if (!is_continuation(p[i]))
                return false;

        // Second-byte range checks reject overlongs, surrogates and > U+10FFFF
        if (*p == 0xE0u && p[1] < 0xA0u)
            return false;
        if (*p == 0xEDu && p[1] > 0x9Fu)
            return false;
        if (*p == 0xF0u && p[1] < 0x90u)
            return false;
        if (*p == 0xF4u && p[1] > 0x8Fu)
            return false;

        p += length;
    }

    return true;
}

} // namespace internal
} // namespace rgmcp
