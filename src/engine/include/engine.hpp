#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "abi_type.hpp"
#include "address_labeler.hpp"
#include "classifier.hpp"
#include "decode_error.hpp"
#include "deployment_record.hpp"
#include "legacy_decoder.hpp"
#include "normalize_error.hpp"
#include "value.hpp"

namespace ddc::engine
{
    struct EngineError
    {
        enum class Stage : std::uint8_t
        {
            UNKNOWN = 0,
            DECODE,
            NORMALIZE
        } stage = Stage::UNKNOWN;

        classify::PayloadKind payload = classify::PayloadKind::ABI_BINARY;

        std::variant<abi::DecodeError, record::NormalizeError> cause;
    };

    template<class T>
    using Result = std::expected<T, EngineError>;

    /**
     * @brief Human readable description naming the stage, the error kind and its details.
     */
    std::string describe(const EngineError & error);

    struct DecodeRequest
    {
        std::string call_data;
        std::optional<std::string> sender;
    };

    /**
     * @brief Decoding pipeline: classify, decode, normalize, label.
     * 
     * Holds references to the configuration tables, which must outlive the engine.
     * All methods are const and may run concurrently.
     */
    class Engine
    {
        public:
            Engine(const abi::FunctionInterface & function_interface, const legacy::LegacyLayout & legacy_layout, const labels::AddressLabeler & labeler);

            /**
             * @brief Classifies the raw call data and decodes it with the matching decoder.
             */
            Result<abi::DecodedCall> decodeCall(std::string_view call_data) const;

            /**
             * @brief Runs the whole pipeline for one payload.
             * 
             * @param call_data Raw transaction input (JSON, hex encoded JSON or ABI call data).
             * @param sender Transaction sender, labeled when it is a known address.
             */
            Result<record::DeploymentRecord> decode(std::string_view call_data, const std::optional<std::string> & sender = std::nullopt) const;

            /**
             * @brief Decodes independent payloads on a thread pool.
             * 
             * @return One result per request, in request order.
             */
            std::vector<Result<record::DeploymentRecord>> decodeBatch(const std::vector<DecodeRequest> & requests, std::size_t threads) const;

        private:
            Result<abi::DecodedCall> _decodeCall(std::string_view call_data, classify::PayloadKind payload) const;

            const abi::FunctionInterface & _function_interface;
            const legacy::LegacyLayout & _legacy_layout;
            const labels::AddressLabeler & _labeler;
    };
}

template <>
struct std::formatter<ddc::engine::EngineError::Stage> : std::formatter<std::string> {
    auto format(const ddc::engine::EngineError::Stage & stage, format_context& ctx) const {
        switch(stage)
        {
            case ddc::engine::EngineError::Stage::DECODE : return formatter<string>::format("decode", ctx);
            case ddc::engine::EngineError::Stage::NORMALIZE : return formatter<string>::format("normalize", ctx);

            default:  return formatter<string>::format("unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
