#pragma once

#include <nlohmann/json.hpp>

#include "deployment_record.hpp"
#include "engine.hpp"

namespace ddc::report
{
    // placeholder shown when the context carries no id
    inline constexpr const char * NOT_AVAILABLE = "N/A";

    /**
     * @brief Renders a record for display. Malformed embedded JSON is shown as its raw text
     * together with `"decode_failed": true`.
     */
    nlohmann::json toJson(const record::DeploymentRecord & record);

    nlohmann::json toJson(const engine::EngineError & error);
}
