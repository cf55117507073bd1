#pragma once

#include <array>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "parse_error.hpp"

namespace ddc::abi
{
    struct Param;

    /**
     * @brief Recursive description of a Solidity ABI type.
     * 
     * Scalars carry their bit width (`uintN`, `intN`) or byte size (`bytesN`).
     * Tuples carry named components, arrays carry exactly one element type.
     */
    struct ParamType
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            ADDRESS,
            BOOL,
            UINT,
            INT,
            FIXED_BYTES,
            BYTES,
            STRING,

            TUPLE,
            ARRAY,
            FIXED_ARRAY
        };

        Kind kind = Kind::UNKNOWN;

        // bit width for UINT/INT, byte count for FIXED_BYTES, length for FIXED_ARRAY
        std::size_t size = 0;

        std::vector<Param> components;
        std::vector<ParamType> element;

        bool isDynamic() const;

        /**
         * @brief Number of bytes the type occupies in the head region.
         */
        std::size_t headSize() const;

        /**
         * @brief Canonical type string as used in function signatures, e.g. `(string,uint256)[]`.
         */
        std::string canonical() const;

        const ParamType & elementType() const;
    };

    struct Param
    {
        std::string name;
        ParamType type;
    };

    /**
     * @brief Immutable description of the single function the engine decodes.
     */
    struct FunctionInterface
    {
        std::string name;
        std::vector<Param> inputs;

        // when set, call data must start with these bytes
        std::optional<std::array<std::uint8_t, 4>> selector;

        std::string signature() const;
    };

    /**
     * @brief Builds a ParamType from its Solidity type string and, for tuples, the ABI `components` array.
     */
    parse::Result<ParamType> parseParamType(const std::string & type, const nlohmann::json & components);

    /**
     * @brief Loads a function interface from ABI JSON.
     * 
     * Accepts a wrapper object `{"function": ..., "selector": ..., "abi": [...]}`,
     * a bare ABI array, or a single ABI function entry.
     * 
     * @param abi_json The parsed ABI document.
     * @param function_name The function to look up when the document does not name one.
     */
    parse::Result<FunctionInterface> parseFunctionInterface(const nlohmann::json & abi_json, const std::string & function_name);
}

template <>
struct std::formatter<ddc::abi::ParamType::Kind> : std::formatter<std::string> {
    auto format(const ddc::abi::ParamType::Kind & kind, format_context& ctx) const {
        switch(kind)
        {
            case ddc::abi::ParamType::Kind::ADDRESS : return formatter<string>::format("address", ctx);
            case ddc::abi::ParamType::Kind::BOOL : return formatter<string>::format("bool", ctx);
            case ddc::abi::ParamType::Kind::UINT : return formatter<string>::format("uint", ctx);
            case ddc::abi::ParamType::Kind::INT : return formatter<string>::format("int", ctx);
            case ddc::abi::ParamType::Kind::FIXED_BYTES : return formatter<string>::format("fixed bytes", ctx);
            case ddc::abi::ParamType::Kind::BYTES : return formatter<string>::format("bytes", ctx);
            case ddc::abi::ParamType::Kind::STRING : return formatter<string>::format("string", ctx);
            case ddc::abi::ParamType::Kind::TUPLE : return formatter<string>::format("tuple", ctx);
            case ddc::abi::ParamType::Kind::ARRAY : return formatter<string>::format("array", ctx);
            case ddc::abi::ParamType::Kind::FIXED_ARRAY : return formatter<string>::format("fixed array", ctx);

            default:  return formatter<string>::format("unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
