#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <vector>

namespace ddc::record
{
    struct NormalizeError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,

            UNSUPPORTED_FUNCTION,
            MISSING_FIELDS

        } kind = Kind::UNKNOWN;

        // UNSUPPORTED_FUNCTION
        std::string function_name;

        // MISSING_FIELDS, in the order they were checked
        std::vector<std::string> missing_fields;
    };

    template<class T>
    using NormalizeResult = std::expected<T, NormalizeError>;
}

template <>
struct std::formatter<ddc::record::NormalizeError::Kind> : std::formatter<std::string> {
    auto format(const ddc::record::NormalizeError::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case ddc::record::NormalizeError::Kind::UNSUPPORTED_FUNCTION : return formatter<string>::format("Unsupported function", ctx);
            case ddc::record::NormalizeError::Kind::MISSING_FIELDS : return formatter<string>::format("Missing fields", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
