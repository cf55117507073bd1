#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace ddc::record
{
    /**
     * @brief Original text of an embedded JSON field that failed to parse.
     */
    struct RawText
    {
        std::string text;
        bool decode_failed = true;
        std::string error;

        bool operator==(const RawText &) const = default;
    };

    /**
     * @brief Either the parsed JSON value or the untouched raw text.
     */
    class ParsedOrRaw
    {
        public:
            explicit ParsedOrRaw(nlohmann::json parsed);
            explicit ParsedOrRaw(RawText raw);

            bool isParsed() const;

            const nlohmann::json * parsed() const;
            const RawText * raw() const;

            bool operator==(const ParsedOrRaw & other) const;

        private:
            std::variant<nlohmann::json, RawText> _value;
    };

    /**
     * @brief Strictly parses embedded JSON text.
     * 
     * On failure the original text is returned with the failure flag set.
     */
    ParsedOrRaw extract(std::string_view raw_text);

    /**
     * @brief Like extract, but empty or whitespace-only text yields std::nullopt.
     */
    std::optional<ParsedOrRaw> extractField(std::string_view raw_text);

    /**
     * @brief Returns the `id` member of a parsed context object.
     * 
     * String ids are returned as is, any other JSON value in its serialized form.
     */
    std::optional<std::string> contextId(const std::optional<ParsedOrRaw> & context);
}
