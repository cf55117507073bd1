#include "legacy_decoder.hpp"

#include <cstdint>
#include <format>

#include <nlohmann/json.hpp>

namespace ddc::legacy
{
    using json = nlohmann::json;

    namespace
    {
        abi::DecodeError _shapeMismatch(std::string message)
        {
            return abi::DecodeError{abi::DecodeError::Kind::SHAPE_MISMATCH, std::move(message)};
        }

        abi::DecodeResult<const json *> _arraySlot(const json & parent, std::size_t index, const char * what)
        {
            if(!parent.is_array() || index >= parent.size())
            {
                return std::unexpected(_shapeMismatch(std::format("Missing {} at index {}", what, index)));
            }

            const json & slot = parent[index];
            if(!slot.is_array())
            {
                return std::unexpected(_shapeMismatch(std::format("Expected {} at index {} to be an array, got {}", what, index, slot.type_name())));
            }
            return &slot;
        }

        abi::DecodeResult<abi::Value> _textSlot(const json & parent, std::size_t index, const char * what)
        {
            if(index >= parent.size())
            {
                return std::unexpected(_shapeMismatch(std::format("Missing {} at index {}", what, index)));
            }

            const json & slot = parent[index];
            if(!slot.is_string())
            {
                return std::unexpected(_shapeMismatch(std::format("Expected {} at index {} to be a string, got {}", what, index, slot.type_name())));
            }
            return abi::Value{slot.get<std::string>()};
        }

        // absent when the array ends before the slot
        abi::DecodeResult<std::optional<abi::Value>> _optionalSlot(const json & parent, std::size_t index, const char * what)
        {
            if(index >= parent.size())
            {
                return std::optional<abi::Value>{};
            }

            const json & slot = parent[index];
            if(slot.is_string())
            {
                return std::optional<abi::Value>{abi::Value{slot.get<std::string>()}};
            }

            if(slot.is_number_integer())
            {
                return std::optional<abi::Value>{abi::Value{slot.dump()}};
            }

            return std::unexpected(_shapeMismatch(std::format("Expected {} at index {} to be a string or integer, got {}", what, index, slot.type_name())));
        }

        void _readIndex(const json & layout_json, const char * key, std::size_t & out)
        {
            if(layout_json.contains(key))
            {
                out = layout_json[key].get<std::size_t>();
            }
        }
    }

    parse::Result<LegacyLayout> parseLegacyLayout(const json & layout_json)
    {
        if(!layout_json.is_object())
        {
            return std::unexpected(parse::ParseError{parse::ParseError::Kind::TYPE_MISMATCH, "Legacy layout must be a JSON object"});
        }

        for(const auto & [key, value] : layout_json.items())
        {
            if(!value.is_number_integer() || value.get<std::int64_t>() < 0)
            {
                return std::unexpected(parse::ParseError{parse::ParseError::Kind::TYPE_MISMATCH, std::format("Legacy layout index '{}' must be a non-negative integer", key)});
            }
        }

        LegacyLayout layout;
        _readIndex(layout_json, "main_tuple", layout.main_tuple);
        _readIndex(layout_json, "token_config", layout.token_config);
        _readIndex(layout_json, "rewards_config", layout.rewards_config);
        _readIndex(layout_json, "name", layout.name);
        _readIndex(layout_json, "symbol", layout.symbol);
        _readIndex(layout_json, "image", layout.image);
        _readIndex(layout_json, "metadata", layout.metadata);
        _readIndex(layout_json, "context", layout.context);
        _readIndex(layout_json, "originating_chain_id", layout.originating_chain_id);
        _readIndex(layout_json, "creator_reward_recipient", layout.creator_reward_recipient);
        return layout;
    }

    abi::DecodeResult<abi::DecodedCall> decode(const json & payload, const LegacyLayout & layout)
    {
        if(!payload.is_object())
        {
            return std::unexpected(_shapeMismatch(std::format("Expected a JSON object, got {}", payload.type_name())));
        }

        const auto params_it = payload.find("params");
        if(params_it == payload.end())
        {
            return std::unexpected(_shapeMismatch("Missing params"));
        }

        const auto main_res = _arraySlot(*params_it, layout.main_tuple, "main tuple");
        if(!main_res) return std::unexpected(main_res.error());
        const json & main_tuple = **main_res;

        const auto token_res = _arraySlot(main_tuple, layout.token_config, "token config");
        if(!token_res) return std::unexpected(token_res.error());
        const json & token_config = **token_res;

        const auto rewards_res = _arraySlot(main_tuple, layout.rewards_config, "rewards config");
        if(!rewards_res) return std::unexpected(rewards_res.error());
        const json & rewards_config = **rewards_res;

        auto name = _textSlot(token_config, layout.name, "token name");
        if(!name) return std::unexpected(name.error());

        auto symbol = _textSlot(token_config, layout.symbol, "token symbol");
        if(!symbol) return std::unexpected(symbol.error());

        auto metadata = _textSlot(token_config, layout.metadata, "metadata");
        if(!metadata) return std::unexpected(metadata.error());

        auto context = _textSlot(token_config, layout.context, "context");
        if(!context) return std::unexpected(context.error());

        auto image = _optionalSlot(token_config, layout.image, "image url");
        if(!image) return std::unexpected(image.error());

        auto chain_id = _optionalSlot(token_config, layout.originating_chain_id, "originating chain id");
        if(!chain_id) return std::unexpected(chain_id.error());

        auto recipient = _textSlot(rewards_config, layout.creator_reward_recipient, "creator reward recipient");
        if(!recipient) return std::unexpected(recipient.error());

        abi::Struct token;
        token.set("name", std::move(*name));
        token.set("symbol", std::move(*symbol));
        if(*image) token.set("image_url", std::move(**image));
        token.set("metadata", std::move(*metadata));
        token.set("context", std::move(*context));
        if(*chain_id) token.set("originating_chain_id", std::move(**chain_id));

        abi::Struct rewards;
        rewards.set("creator_reward_recipient", std::move(*recipient));

        abi::DecodedCall call;
        if(const auto method_it = payload.find("method"); method_it != payload.end() && method_it->is_string())
        {
            call.function_name = method_it->get<std::string>();
        }
        call.arguments.set("token", abi::Value{std::move(token)});
        call.arguments.set("rewards", abi::Value{std::move(rewards)});
        return call;
    }
}
