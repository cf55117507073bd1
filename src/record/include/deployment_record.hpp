#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>

#include "embedded_json.hpp"

namespace ddc::record
{
    enum class SchemaShape : std::uint8_t
    {
        // deploymentConfig.tokenConfig / rewardsConfig, decoded from ABI call data
        NAMED_STRUCT = 0,
        // fixed slot positions of the JSON payload
        POSITIONAL
    };

    struct TokenInfo
    {
        std::string name;
        std::string symbol;
        std::optional<std::string> image_url;
        std::optional<std::string> originating_chain_id;

        // std::nullopt when the field text is empty
        std::optional<ParsedOrRaw> metadata;
        std::optional<ParsedOrRaw> context;

        bool operator==(const TokenInfo &) const = default;
    };

    struct RewardsInfo
    {
        std::string creator_reward_recipient;

        bool operator==(const RewardsInfo &) const = default;
    };

    struct SenderInfo
    {
        std::string address;
        std::optional<std::string> label;

        bool operator==(const SenderInfo &) const = default;
    };

    /**
     * @brief Canonical deployment parameters, independent of the payload encoding.
     */
    struct DeploymentRecord
    {
        TokenInfo token;
        RewardsInfo rewards;

        // `id` member of the parsed context
        std::optional<std::string> context_id;

        std::optional<SenderInfo> sender;

        SchemaShape shape = SchemaShape::NAMED_STRUCT;

        bool operator==(const DeploymentRecord &) const = default;
    };
}

template <>
struct std::formatter<ddc::record::SchemaShape> : std::formatter<std::string> {
    auto format(const ddc::record::SchemaShape & shape, format_context& ctx) const {
        switch(shape)
        {
            case ddc::record::SchemaShape::NAMED_STRUCT : return formatter<string>::format("named", ctx);
            case ddc::record::SchemaShape::POSITIONAL : return formatter<string>::format("positional", ctx);

            default:  return formatter<string>::format("unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
