#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace ddc::classify
{
    enum class PayloadKind : std::uint8_t
    {
        // JSON-RPC style text, already serialized
        ALREADY_JSON = 0,
        // hex encoding of UTF-8 JSON text
        HEX_ENCODED_TEXT,
        // binary ABI encoded call data, also the fallback
        ABI_BINARY
    };

    /**
     * @brief Decides which decode path applies to raw call data.
     * 
     * Never fails: input that is neither JSON nor hex-encoded JSON is treated as ABI call data.
     */
    PayloadKind classify(std::string_view raw);
}

template <>
struct std::formatter<ddc::classify::PayloadKind> : std::formatter<std::string> {
    auto format(const ddc::classify::PayloadKind & kind, format_context& ctx) const {
        switch(kind)
        {
            case ddc::classify::PayloadKind::ALREADY_JSON : return formatter<string>::format("JSON", ctx);
            case ddc::classify::PayloadKind::HEX_ENCODED_TEXT : return formatter<string>::format("Hex encoded JSON", ctx);
            case ddc::classify::PayloadKind::ABI_BINARY : return formatter<string>::format("ABI call data", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
