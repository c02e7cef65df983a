#ifndef RGMCP_TYPES_HPP
#define RGMCP_TYPES_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace rgmcp
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Search Request / Result
// ============================================================================

/// Structured search request as received from a tool call
struct SearchRequest
{
    std::string pattern;                               // Required, non-empty
    std::string path;                                  // Relative to root; empty = root
    bool fixed_strings = false;                        // Literal match instead of regex
    bool case_sensitive = false;                       // Insensitive unless requested
    bool line_numbers = true;                          // Prefix output with line numbers
    std::optional<std::uint64_t> context_lines = std::nullopt;
    std::vector<std::string> file_types;               // Engine file-type filters, in order
    std::optional<std::uint64_t> max_depth = std::nullopt;
};

struct SearchStats
{
    std::uint64_t matched_lines = 0;
    std::uint64_t elapsed_ms = 0;

    json to_json() const
    {
        return json{{"matched_lines", matched_lines}, {"elapsed_ms", elapsed_ms}};
    }
};

/// Raw engine output lines in emission order, plus timing
struct SearchResult
{
    std::vector<std::string> matches;
    SearchStats stats;

    json to_json() const
    {
        return json{{"matches", matches}, {"stats", stats.to_json()}};
    }

    /// Pretty-printed form returned as the tool's text content
    std::string to_pretty_string() const;
};

} // namespace rgmcp

#endif // RGMCP_TYPES_HPP
