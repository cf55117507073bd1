#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>

namespace ddc::abi
{
    struct DecodeError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            TRUNCATED_DATA,
            INVALID_OFFSET,
            MALFORMED_HEX,
            MALFORMED_JSON,
            SELECTOR_MISMATCH,
            SHAPE_MISMATCH

        } kind = Kind::UNKNOWN;

        std::string message;
    };

    template<class T>
    using DecodeResult = std::expected<T, DecodeError>;
}

template <>
struct std::formatter<ddc::abi::DecodeError::Kind> : std::formatter<std::string> {
    auto format(const ddc::abi::DecodeError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case ddc::abi::DecodeError::Kind::TRUNCATED_DATA : return formatter<string>::format("Truncated data", ctx);
            case ddc::abi::DecodeError::Kind::INVALID_OFFSET : return formatter<string>::format("Invalid offset", ctx);
            case ddc::abi::DecodeError::Kind::MALFORMED_HEX : return formatter<string>::format("Malformed hex", ctx);
            case ddc::abi::DecodeError::Kind::MALFORMED_JSON : return formatter<string>::format("Malformed JSON", ctx);
            case ddc::abi::DecodeError::Kind::SELECTOR_MISMATCH : return formatter<string>::format("Selector mismatch", ctx);
            case ddc::abi::DecodeError::Kind::SHAPE_MISMATCH : return formatter<string>::format("Shape mismatch", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
