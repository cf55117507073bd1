#include "engine.hpp"

#include <algorithm>

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "abi_decoder.hpp"
#include "normalizer.hpp"
#include "utils.hpp"

namespace ddc::engine
{
    using json = nlohmann::json;

    namespace
    {
        EngineError _decodeFailure(classify::PayloadKind payload, abi::DecodeError error)
        {
            return EngineError{EngineError::Stage::DECODE, payload, std::move(error)};
        }

        Result<abi::DecodedCall> _decodeJsonText(const std::string & text, classify::PayloadKind payload, const legacy::LegacyLayout & layout)
        {
            json parsed;
            try
            {
                parsed = json::parse(text);
            }
            catch(const json::exception & e)
            {
                return std::unexpected(_decodeFailure(payload, abi::DecodeError{abi::DecodeError::Kind::MALFORMED_JSON, e.what()}));
            }

            auto call_res = legacy::decode(parsed, layout);
            if(!call_res)
            {
                return std::unexpected(_decodeFailure(payload, std::move(call_res.error())));
            }
            return std::move(*call_res);
        }
    }

    std::string describe(const EngineError & error)
    {
        if(const auto * decode_error = std::get_if<abi::DecodeError>(&error.cause))
        {
            return std::format("{} stage failed on {} payload: {}: {}", error.stage, error.payload, decode_error->kind, decode_error->message);
        }

        const auto & normalize_error = std::get<record::NormalizeError>(error.cause);
        switch(normalize_error.kind)
        {
            case record::NormalizeError::Kind::UNSUPPORTED_FUNCTION:
                return std::format("{} stage failed on {} payload: {}: {}", error.stage, error.payload, normalize_error.kind, normalize_error.function_name);

            case record::NormalizeError::Kind::MISSING_FIELDS:
            {
                std::string fields;
                for(const auto & field : normalize_error.missing_fields)
                {
                    if(!fields.empty()) fields += ", ";
                    fields += field;
                }
                return std::format("{} stage failed on {} payload: {}: {}", error.stage, error.payload, normalize_error.kind, fields);
            }

            default:
                return std::format("{} stage failed on {} payload: {}", error.stage, error.payload, normalize_error.kind);
        }
    }

    Engine::Engine(const abi::FunctionInterface & function_interface, const legacy::LegacyLayout & legacy_layout, const labels::AddressLabeler & labeler)
    :   _function_interface(function_interface),
        _legacy_layout(legacy_layout),
        _labeler(labeler)
    {

    }

    Result<abi::DecodedCall> Engine::decodeCall(std::string_view call_data) const
    {
        return _decodeCall(call_data, classify::classify(call_data));
    }

    Result<abi::DecodedCall> Engine::_decodeCall(std::string_view call_data, classify::PayloadKind payload) const
    {
        spdlog::debug(std::format("Call data classified as {}", payload));

        switch(payload)
        {
            case classify::PayloadKind::ALREADY_JSON:
                return _decodeJsonText(std::string(utils::trim(call_data)), payload, _legacy_layout);

            case classify::PayloadKind::HEX_ENCODED_TEXT:
            {
                const auto text = utils::decodeHexText(call_data);
                if(!text)
                {
                    return std::unexpected(_decodeFailure(payload, abi::DecodeError{abi::DecodeError::Kind::MALFORMED_HEX, "Call data is not valid hex"}));
                }
                return _decodeJsonText(*text, payload, _legacy_layout);
            }

            default:
            {
                const auto bytes = evmc::from_hex(utils::trim(call_data));
                if(!bytes)
                {
                    return std::unexpected(_decodeFailure(payload, abi::DecodeError{abi::DecodeError::Kind::MALFORMED_HEX, "Call data is not valid hex"}));
                }

                auto call_res = abi::decodeCall(_function_interface, bytes->data(), bytes->size());
                if(!call_res)
                {
                    return std::unexpected(_decodeFailure(payload, std::move(call_res.error())));
                }
                return std::move(*call_res);
            }
        }
    }

    Result<record::DeploymentRecord> Engine::decode(std::string_view call_data, const std::optional<std::string> & sender) const
    {
        const classify::PayloadKind payload = classify::classify(call_data);

        auto call_res = _decodeCall(call_data, payload);
        if(!call_res)
        {
            spdlog::warn("Failed to decode call data: {}", describe(call_res.error()));
            return std::unexpected(std::move(call_res.error()));
        }

        auto record_res = record::normalize(*call_res);
        if(!record_res)
        {
            EngineError error{EngineError::Stage::NORMALIZE, payload, std::move(record_res.error())};
            spdlog::warn("Failed to normalize decoded call: {}", describe(error));
            return std::unexpected(std::move(error));
        }

        record::DeploymentRecord & record = *record_res;

        if(record.token.metadata && !record.token.metadata->isParsed())
        {
            spdlog::warn("Token metadata is not valid JSON: {}", record.token.metadata->raw()->error);
        }
        if(record.token.context && !record.token.context->isParsed())
        {
            spdlog::warn("Token context is not valid JSON: {}", record.token.context->raw()->error);
        }

        if(sender)
        {
            record.sender = record::SenderInfo{*sender, _labeler.label(*sender)};
        }

        spdlog::debug(std::format("Decoded {} deployment of '{}' ({})", record.shape, record.token.name, record.token.symbol));
        return std::move(record);
    }

    std::vector<Result<record::DeploymentRecord>> Engine::decodeBatch(const std::vector<DecodeRequest> & requests, std::size_t threads) const
    {
        std::vector<Result<record::DeploymentRecord>> results(requests.size());

        asio::thread_pool pool(std::max<std::size_t>(threads, 1));
        for(std::size_t i = 0; i < requests.size(); ++i)
        {
            asio::post(pool, [this, &requests, &results, i]()
            {
                results[i] = decode(requests[i].call_data, requests[i].sender);
            });
        }
        pool.join();

        return results;
    }
}
