#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <cstdint>

#ifdef interface
    #undef interface
#endif
#include <evmc/hex.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace ddc::utils
{
    std::string currentTimestamp();

    std::string toLower(std::string value);

    /**
     * @brief Removes leading and trailing whitespace.
     */
    std::string_view trim(std::string_view value);

    /**
     * @brief Checks that the text is a `0x` prefixed, 40 hex digit account address.
     */
    bool isAddress(std::string_view value);

    /**
     * @brief Decodes bytes as UTF-8, substituting U+FFFD for every invalid sequence.
     * 
     * @return Valid UTF-8 text of the same logical content.
     */
    std::string sanitizeUtf8(evmc::bytes_view bytes);

    /**
     * @brief Hex decodes the value (optional `0x` prefix) and interprets the bytes as UTF-8 text.
     * 
     * Invalid UTF-8 sequences are replaced, surrounding whitespace is trimmed.
     * 
     * @return The decoded text or std::nullopt when the value is not valid hex.
     */
    std::optional<std::string> decodeHexText(std::string_view value);
}
