#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>

namespace ddc::utils
{
    namespace
    {
        bool _hasHexPrefix(std::string_view value)
        {
            return value.size() >= 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X');
        }
    }

    std::string currentTimestamp()
    {
        const auto zt{ std::chrono::zoned_time{
            std::chrono::current_zone(),
            std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now())}
            };
        std::string ts = std::format("{:%F-%H_%M_%S}", zt);
        return ts;
    }

    std::string toLower(std::string value)
    {
        std::ranges::transform(value, value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string_view trim(std::string_view value)
    {
        const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

        while(!value.empty() && is_space(value.front()))
        {
            value.remove_prefix(1);
        }
        while(!value.empty() && is_space(value.back()))
        {
            value.remove_suffix(1);
        }
        return value;
    }

    bool isAddress(std::string_view value)
    {
        if(value.size() != 42 || !_hasHexPrefix(value))
        {
            return false;
        }

        return std::ranges::all_of(value.substr(2), [](unsigned char c) { return std::isxdigit(c) != 0; });
    }

    std::string sanitizeUtf8(evmc::bytes_view bytes)
    {
        static constexpr std::string_view replacement = "\xEF\xBF\xBD";

        std::string out;
        out.reserve(bytes.size());

        std::size_t i = 0;
        while(i < bytes.size())
        {
            const std::uint8_t lead = bytes[i];

            if(lead < 0x80)
            {
                out.push_back(static_cast<char>(lead));
                ++i;
                continue;
            }

            std::size_t length = 0;
            std::uint8_t min_second = 0x80;
            std::uint8_t max_second = 0xBF;

            if(lead >= 0xC2 && lead <= 0xDF)
            {
                length = 2;
            }
            else if(lead >= 0xE0 && lead <= 0xEF)
            {
                length = 3;
                if(lead == 0xE0) min_second = 0xA0;
                if(lead == 0xED) max_second = 0x9F;
            }
            else if(lead >= 0xF0 && lead <= 0xF4)
            {
                length = 4;
                if(lead == 0xF0) min_second = 0x90;
                if(lead == 0xF4) max_second = 0x8F;
            }

            if(length == 0)
            {
                out.append(replacement);
                ++i;
                continue;
            }

            // maximal subpart of an ill-formed sequence is replaced by a single U+FFFD
            std::size_t consumed = 1;
            bool valid = true;
            for(; consumed < length; ++consumed)
            {
                if(i + consumed >= bytes.size())
                {
                    valid = false;
                    break;
                }

                const std::uint8_t c = bytes[i + consumed];
                const std::uint8_t lo = (consumed == 1) ? min_second : std::uint8_t{0x80};
                const std::uint8_t hi = (consumed == 1) ? max_second : std::uint8_t{0xBF};
                if(c < lo || c > hi)
                {
                    valid = false;
                    break;
                }
            }

            if(!valid)
            {
                out.append(replacement);
                i += consumed;
                continue;
            }

            out.append(reinterpret_cast<const char*>(bytes.data() + i), length);
            i += length;
        }

        return out;
    }

    std::optional<std::string> decodeHexText(std::string_view value)
    {
        const auto bytes_res = evmc::from_hex(trim(value));
        if(!bytes_res)
        {
            return std::nullopt;
        }

        const std::string text = sanitizeUtf8(evmc::bytes_view{bytes_res->data(), bytes_res->size()});
        return std::string(trim(text));
    }
}
