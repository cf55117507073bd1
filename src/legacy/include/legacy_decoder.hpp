#pragma once

#include <cstddef>
#include <optional>

#include <nlohmann/json_fwd.hpp>

#include "decode_error.hpp"
#include "parse_error.hpp"
#include "value.hpp"

namespace ddc::legacy
{
    /**
     * @brief Slot positions of the positional (pre-ABI) deploy payload.
     * 
     * `params[main_tuple]` is the main tuple, `main[token_config]` the token configuration array
     * and `main[rewards_config]` the rewards configuration array. The remaining fields index into those.
     */
    struct LegacyLayout
    {
        std::size_t main_tuple = 0;
        std::size_t token_config = 0;
        std::size_t rewards_config = 4;

        std::size_t name = 0;
        std::size_t symbol = 1;
        std::size_t image = 3;
        std::size_t metadata = 4;
        std::size_t context = 5;
        std::size_t originating_chain_id = 6;

        std::size_t creator_reward_recipient = 1;
    };

    /**
     * @brief Reads a layout, keeping the default for every index the document leaves out.
     */
    parse::Result<LegacyLayout> parseLegacyLayout(const nlohmann::json & layout_json);

    /**
     * @brief Extracts the deploy fields from a positional JSON payload.
     * 
     * The result carries `token` and `rewards` structs with canonical field names
     * (`name`, `symbol`, `image_url`, `metadata`, `context`, `originating_chain_id`,
     * `creator_reward_recipient`). Optional slots beyond the end of their array are left out.
     * A `method` string in the envelope becomes the function name.
     * 
     * @return The call, or SHAPE_MISMATCH naming the first slot that is absent or of the wrong type.
     */
    abi::DecodeResult<abi::DecodedCall> decode(const nlohmann::json & payload, const LegacyLayout & layout);
}
