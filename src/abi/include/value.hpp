#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace ddc::abi
{
    struct Value;

    using Bytes = std::vector<std::uint8_t>;
    using List = std::vector<Value>;

    /**
     * @brief Integer of any ABI width, kept as the raw 256-bit word.
     */
    struct Integer
    {
        evmc::bytes32 word{};
        bool is_signed = false;

        bool operator==(const Integer &) const = default;
    };

    /**
     * @brief Tuple value keyed by field name, in declaration order.
     */
    struct Struct
    {
        std::vector<std::string> names;
        List values;

        const Value * find(const std::string & name) const;
        void set(std::string name, Value value);

        bool operator==(const Struct &) const = default;
    };

    struct Value
    {
        std::variant<std::string, Integer, bool, evmc::address, Bytes, Struct, List> data;

        bool isStruct() const { return std::holds_alternative<Struct>(data); }
        bool isList() const { return std::holds_alternative<List>(data); }

        const std::string * asString() const { return std::get_if<std::string>(&data); }
        const Struct * asStruct() const { return std::get_if<Struct>(&data); }
        const List * asList() const { return std::get_if<List>(&data); }

        bool operator==(const Value &) const = default;
    };

    /**
     * @brief Result of decoding one call, produced fresh for every payload.
     * 
     * The function name is empty when the payload does not carry one.
     */
    struct DecodedCall
    {
        std::optional<std::string> function_name;
        Struct arguments;

        bool operator==(const DecodedCall &) const = default;
    };

    /**
     * @brief Renders a scalar value as text.
     * 
     * Integers become decimal numbers, addresses and byte strings lowercase `0x` hex,
     * booleans `true`/`false`. Composite values yield std::nullopt.
     */
    std::optional<std::string> toString(const Value & value);

    /**
     * @brief Walks nested structs by field name, e.g. {"deploymentConfig", "tokenConfig"}.
     */
    const Value * findPath(const Struct & root, std::initializer_list<std::string> path);
}
