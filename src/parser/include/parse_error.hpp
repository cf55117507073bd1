#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace ddc::parse
{   
    struct ParseError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN         = 0U,

            INVALID_VALUE   = 1U,
            OUT_OF_RANGE    = 2U,
            TYPE_MISMATCH   = 3U,
            MISSING_FIELD   = 4U,
            IO_ERROR        = 5U
        };
        
        Kind kind = Kind::UNKNOWN;
        std::string message = "";
    };

    template<class T>
    using Result = std::expected<T, ParseError>;
}

template <>
struct std::formatter<ddc::parse::ParseError::Kind> : std::formatter<std::string> {
    auto format(const ddc::parse::ParseError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case ddc::parse::ParseError::Kind::INVALID_VALUE : return formatter<string>::format("Invalid value", ctx);
            case ddc::parse::ParseError::Kind::OUT_OF_RANGE : return formatter<string>::format("Out of range", ctx);
            case ddc::parse::ParseError::Kind::TYPE_MISMATCH : return formatter<string>::format("Type mismatch", ctx);
            case ddc::parse::ParseError::Kind::MISSING_FIELD : return formatter<string>::format("Missing field", ctx);
            case ddc::parse::ParseError::Kind::IO_ERROR : return formatter<string>::format("I/O error", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
