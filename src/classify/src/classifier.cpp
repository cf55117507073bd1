#include "classifier.hpp"

#include "utils.hpp"

namespace ddc::classify
{
    PayloadKind classify(std::string_view raw)
    {
        const std::string_view trimmed = utils::trim(raw);
        if(trimmed.starts_with('{'))
        {
            return PayloadKind::ALREADY_JSON;
        }

        const auto text = utils::decodeHexText(trimmed);
        if(text && text->starts_with('{'))
        {
            return PayloadKind::HEX_ENCODED_TEXT;
        }

        return PayloadKind::ABI_BINARY;
    }
}
