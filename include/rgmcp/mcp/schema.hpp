#ifndef RGMCP_MCP_SCHEMA_HPP
#define RGMCP_MCP_SCHEMA_HPP

#include <functional>
#include <limits>
#include <rgmcp/errors.hpp>
#include <rgmcp/mcp/type_traits.hpp>
#include <string>
#include <utility>
#include <vector>

namespace rgmcp
{
namespace mcp
{

// ============================================================================
// JSON to Field Conversion
// ============================================================================

/// Convert a JSON value to a field type, reporting failures against field_name.
/// Unlike nlohmann's get<T>(), no implicit conversions are made: a number is
/// never accepted for a bool, a string never for an integer.
template <typename T>
T decode_field(const json& j, const std::string& field_name)
{
    using BaseType = remove_cvref_t<T>;

    if constexpr (std::is_same_v<BaseType, bool>)
    {
        if (!j.is_boolean())
            throw InvalidParamsError(field_name, "must be a boolean");
        return j.get<bool>();
    }
    else if constexpr (is_unsigned_integer_v<BaseType>)
    {
        // Values built in code are signed even when non-negative; parsed ones are unsigned
        if (!j.is_number_integer() || (!j.is_number_unsigned() && j.get<std::int64_t>() < 0))
            throw InvalidParamsError(field_name, "must be a non-negative integer");

        auto value = j.get<std::uint64_t>();
        if (value > std::numeric_limits<BaseType>::max())
            throw InvalidParamsError(field_name, "is out of range");
        return static_cast<BaseType>(value);
    }
    else if constexpr (std::is_same_v<BaseType, std::string>)
    {
        if (!j.is_string())
            throw InvalidParamsError(field_name, "must be a string");
        return j.get<std::string>();
    }
    else if constexpr (is_vector<BaseType>::value)
    {
        using ItemType = typename BaseType::value_type;
        if (!j.is_array())
            throw InvalidParamsError(field_name, "must be an array");

        BaseType items;
        items.reserve(j.size());
        for (size_t i = 0; i < j.size(); ++i)
            items.push_back(
                decode_field<ItemType>(j[i], field_name + "[" + std::to_string(i) + "]"));
        return items;
    }
    else if constexpr (is_optional<BaseType>::value)
    {
        return BaseType(decode_field<typename BaseType::value_type>(j, field_name));
    }
    else
    {
        static_assert(always_false<T>::value, "Unsupported field type");
        return BaseType{};
    }
}

// ============================================================================
// Object Schema
// ============================================================================

/**
 * Declarative description of a JSON object that maps onto struct T.
 *
 * Each property is declared once and drives both the advertised JSON Schema
 * and decoding of incoming arguments:
 *
 * @code
 * auto schema = ObjectSchema<Options>()
 *     .property("name", "Display name", &Options::name, true)
 *     .property("verbose", "Chatty output", &Options::verbose);
 * Options opts = schema.decode(args);
 * @endcode
 *
 * Non-required, non-optional members advertise the value found in a
 * default-constructed T as their "default". Unknown properties are rejected.
 */
template <typename T>
class ObjectSchema
{
  public:
    ObjectSchema()
    {
        schema_ = json{{"type", "object"},
                       {"properties", json::object()},
                       {"required", json::array()},
                       {"additionalProperties", false}};
    }

    /// Declare a property bound to a data member
    template <typename M>
    ObjectSchema& property(const std::string& name, const std::string& description,
                           M T::*member, bool required = false)
    {
        json prop = TypeToSchema<M>::get();
        prop["description"] = description;
        if constexpr (!is_optional<M>::value)
        {
            if (!required)
                prop["default"] = T{}.*member;
        }
        schema_["properties"][name] = std::move(prop);

        if (required)
        {
            schema_["required"].push_back(name);
            required_.push_back(name);
        }

        fields_.push_back(Field{name, required,
                                [member, name](T& target, const json& value)
                                { target.*member = decode_field<M>(value, name); }});
        return *this;
    }

    /// JSON Schema for this object
    const json& to_json() const
    {
        return schema_;
    }

    /// Names of required properties, in declaration order
    const std::vector<std::string>& required() const
    {
        return required_;
    }

    /**
     * Decode an arguments object into T.
     *
     * Absent or null non-required properties keep their default value.
     * @throws InvalidParamsError naming the offending field
     */
    T decode(const json& args) const
    {
        if (!args.is_object())
            throw InvalidParamsError("arguments", "must be an object");

        for (const auto& item : args.items())
        {
            if (find(item.key()) == nullptr)
                throw InvalidParamsError(item.key(), "is not a recognized property");
        }

        T result{};
        for (const auto& field : fields_)
        {
            auto it = args.find(field.name);
            if (it == args.end() || it->is_null())
            {
                if (field.required)
                    throw InvalidParamsError(field.name, "is required");
                continue;
            }
            field.assign(result, *it);
        }
        return result;
    }

  private:
    struct Field
    {
        std::string name;
        bool required;
        std::function<void(T&, const json&)> assign;
    };

    const Field* find(const std::string& name) const
    {
        for (const auto& field : fields_)
            if (field.name == name)
                return &field;
        return nullptr;
    }

    std::vector<Field> fields_;
    std::vector<std::string> required_;
    json schema_;
};

} // namespace mcp
} // namespace rgmcp

#endif // RGMCP_MCP_SCHEMA_HPP
