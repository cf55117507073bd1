#pragma once

#include <optional>
#include <string>
#include <cstdint>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace ddc::utils
{
    std::optional<std::size_t> readWordAsSizeT(const std::uint8_t* data, std::size_t data_size, std::size_t offset);

    std::optional<evmc::bytes32> readWord(const std::uint8_t* data, std::size_t data_size, std::size_t offset);

    evmc::bytes32 wordFromUint64(std::uint64_t value);

    evmc::bytes32 wordFromInt64(std::int64_t value);

    /**
     * @brief Renders a 256-bit big-endian word as a decimal number.
     * 
     * @param word The word to render.
     * @param is_signed Interpret the word as two's complement.
     */
    std::string wordToDecimal(const evmc::bytes32 & word, bool is_signed);
}
