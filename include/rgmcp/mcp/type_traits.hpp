#ifndef RGMCP_MCP_TYPE_TRAITS_HPP
#define RGMCP_MCP_TYPE_TRAITS_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace rgmcp
{
namespace mcp
{

using json = nlohmann::json;

// ============================================================================
// Helper Utilities
// ============================================================================

/// Always-false helper for static_assert in if constexpr branches
template <typename T>
struct always_false : std::false_type
{
};

/// Helper to remove cv-ref qualifiers
template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename U>
struct is_vector : std::false_type
{
};

template <typename U, typename Alloc>
struct is_vector<std::vector<U, Alloc>> : std::true_type
{
};

template <typename U>
struct is_optional : std::false_type
{
};

template <typename U>
struct is_optional<std::optional<U>> : std::true_type
{
};

template <typename T>
inline constexpr bool is_unsigned_integer_v =
    std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>;

// ============================================================================
// Type to JSON Schema Mapping
// ============================================================================

/// Maps C++ field types to JSON Schema objects.
/// Supports: bool, unsigned integers, std::string, std::vector<T>, std::optional<T>
template <typename T>
struct TypeToSchema
{
    static json get()
    {
        using BaseType = remove_cvref_t<T>;

        if constexpr (std::is_same_v<BaseType, bool>)
        {
            return json{{"type", "boolean"}};
        }
        else if constexpr (is_unsigned_integer_v<BaseType>)
        {
            return json{{"type", "integer"}, {"minimum", 0}};
        }
        else if constexpr (std::is_same_v<BaseType, std::string>)
        {
            return json{{"type", "string"}};
        }
        else if constexpr (is_vector<BaseType>::value)
        {
            using ItemType = typename BaseType::value_type;
            return json{{"type", "array"}, {"items", TypeToSchema<ItemType>::get()}};
        }
        else if constexpr (is_optional<BaseType>::value)
        {
            // Optionality is expressed by the "required" list, not the type
            return TypeToSchema<typename BaseType::value_type>::get();
        }
        else
        {
            static_assert(always_false<T>::value,
                          "Unsupported field type. Supported types: bool, unsigned integers, "
                          "std::string, std::vector<T>, std::optional<T>");
            return json{};
        }
    }
};

} // namespace mcp
} // namespace rgmcp

#endif // RGMCP_MCP_TYPE_TRAITS_HPP
