#include "math.hpp"

#include <algorithm>
#include <cstring>

namespace ddc::utils
{
    std::optional<std::size_t> readWordAsSizeT(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        if(data == nullptr || offset > data_size || data_size - offset < 32)
        {
            return std::nullopt;
        }

        std::size_t value = 0;

        constexpr std::size_t prefix = 32 - sizeof(std::size_t);
        for(std::size_t i = 0; i < prefix; ++i)
        {
            if(data[offset + i] != 0)
            {
                return std::nullopt;
            }
        }

        for(std::size_t i = prefix; i < 32; ++i)
        {
            value = (value << 8) | data[offset + i];
        }

        return value;
    }

    std::optional<evmc::bytes32> readWord(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        if(data == nullptr || offset > data_size || data_size - offset < 32)
        {
            return std::nullopt;
        }

        evmc::bytes32 word{};
        std::memcpy(word.bytes, data + offset, 32);
        return word;
    }

    evmc::bytes32 wordFromUint64(std::uint64_t value)
    {
        evmc::bytes32 word{};
        for(int i = 0; i < 8; ++i)
        {
            word.bytes[31 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
        }
        return word;
    }

    evmc::bytes32 wordFromInt64(std::int64_t value)
    {
        evmc::bytes32 word = wordFromUint64(static_cast<std::uint64_t>(value));
        if(value < 0)
        {
            std::fill(word.bytes, word.bytes + 24, std::uint8_t{0xFF});
        }
        return word;
    }

    std::string wordToDecimal(const evmc::bytes32 & word, bool is_signed)
    {
        std::uint8_t magnitude[32];
        std::memcpy(magnitude, word.bytes, 32);

        const bool negative = is_signed && (magnitude[0] & 0x80u) != 0;
        if(negative)
        {
            // two's complement negation
            unsigned carry = 1;
            for(int i = 31; i >= 0; --i)
            {
                const unsigned v = static_cast<std::uint8_t>(~magnitude[i]) + carry;
                magnitude[i] = static_cast<std::uint8_t>(v & 0xFFu);
                carry = v >> 8;
            }
        }

        std::string digits;
        bool is_zero = false;
        while(!is_zero)
        {
            unsigned remainder = 0;
            is_zero = true;
            for(std::size_t i = 0; i < 32; ++i)
            {
                const unsigned current = (remainder << 8) | magnitude[i];
                magnitude[i] = static_cast<std::uint8_t>(current / 10);
                remainder = current % 10;
                if(magnitude[i] != 0)
                {
                    is_zero = false;
                }
            }
            digits.push_back(static_cast<char>('0' + remainder));
        }

        if(negative)
        {
            digits.push_back('-');
        }

        std::ranges::reverse(digits);
        return digits;
    }
}
