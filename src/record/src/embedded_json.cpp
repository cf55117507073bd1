#include "embedded_json.hpp"

#include "utils.hpp"

namespace ddc::record
{
    using json = nlohmann::json;

    ParsedOrRaw::ParsedOrRaw(json parsed)
    :   _value(std::move(parsed))
    {
    }

    ParsedOrRaw::ParsedOrRaw(RawText raw)
    :   _value(std::move(raw))
    {
    }

    bool ParsedOrRaw::isParsed() const
    {
        return std::holds_alternative<json>(_value);
    }

    const json * ParsedOrRaw::parsed() const
    {
        return std::get_if<json>(&_value);
    }

    const RawText * ParsedOrRaw::raw() const
    {
        return std::get_if<RawText>(&_value);
    }

    bool ParsedOrRaw::operator==(const ParsedOrRaw & other) const
    {
        if(isParsed() != other.isParsed())
        {
            return false;
        }

        if(isParsed())
        {
            return *parsed() == *other.parsed();
        }
        return *raw() == *other.raw();
    }

    ParsedOrRaw extract(std::string_view raw_text)
    {
        try
        {
            return ParsedOrRaw(json::parse(raw_text));
        }
        catch(const json::exception & e)
        {
            return ParsedOrRaw(RawText{std::string(raw_text), true, e.what()});
        }
    }

    std::optional<ParsedOrRaw> extractField(std::string_view raw_text)
    {
        if(utils::trim(raw_text).empty())
        {
            return std::nullopt;
        }
        return extract(raw_text);
    }

    std::optional<std::string> contextId(const std::optional<ParsedOrRaw> & context)
    {
        if(!context || !context->isParsed())
        {
            return std::nullopt;
        }

        const json & value = *context->parsed();
        if(!value.is_object())
        {
            return std::nullopt;
        }

        const auto id_it = value.find("id");
        if(id_it == value.end() || id_it->is_null())
        {
            return std::nullopt;
        }

        if(id_it->is_string())
        {
            std::string id = id_it->get<std::string>();
            if(id.empty())
            {
                return std::nullopt;
            }
            return id;
        }
        return id_it->dump();
    }
}
