#pragma once

#include <string_view>

#include "deployment_record.hpp"
#include "normalize_error.hpp"
#include "value.hpp"

namespace ddc::record
{
    inline constexpr std::string_view DEPLOY_FUNCTION_NAME = "deployToken";

    /**
     * @brief Maps a decoded call of either schema onto a DeploymentRecord.
     * 
     * Accepted argument shapes:
     *  - `deploymentConfig.{tokenConfig, rewardsConfig}` (ABI decoded),
     *  - `tokenConfig` and `rewardsConfig` as top level arguments,
     *  - `token` and `rewards` with canonical field names (positional payload).
     * 
     * A call without a function name is taken as a deploy call.
     * Embedded `metadata` and `context` JSON is parsed, keeping the raw text when it is malformed.
     * The sender is left empty.
     * 
     * @return The record, UNSUPPORTED_FUNCTION for any other function or MISSING_FIELDS
     *         listing every required field that is absent.
     */
    NormalizeResult<DeploymentRecord> normalize(const abi::DecodedCall & call);
}
