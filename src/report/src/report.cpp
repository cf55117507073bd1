#include "report.hpp"

#include <format>

namespace ddc::report
{
    using json = nlohmann::json;

    namespace
    {
        json _embedded(const std::optional<record::ParsedOrRaw> & value)
        {
            if(!value)
            {
                return nullptr;
            }

            if(value->isParsed())
            {
                return *value->parsed();
            }

            return json{
                {"raw", value->raw()->text},
                {"decode_failed", value->raw()->decode_failed},
                {"error", value->raw()->error}
            };
        }

        json _optional(const std::optional<std::string> & value)
        {
            if(!value)
            {
                return nullptr;
            }
            return *value;
        }
    }

    json toJson(const record::DeploymentRecord & record)
    {
        json out{
            {"schema", std::format("{}", record.shape)},
            {"token", {
                {"name", record.token.name},
                {"symbol", record.token.symbol},
                {"image_url", _optional(record.token.image_url)},
                {"originating_chain_id", _optional(record.token.originating_chain_id)},
                {"metadata", _embedded(record.token.metadata)},
                {"context", _embedded(record.token.context)}
            }},
            {"context_id", record.context_id.value_or(NOT_AVAILABLE)},
            {"rewards", {
                {"creator_reward_recipient", record.rewards.creator_reward_recipient}
            }}
        };

        if(record.sender)
        {
            out["sender"] = json{
                {"address", record.sender->address},
                {"label", _optional(record.sender->label)}
            };
        }

        return out;
    }

    json toJson(const engine::EngineError & error)
    {
        json out{
            {"stage", std::format("{}", error.stage)},
            {"payload", std::format("{}", error.payload)}
        };

        if(const auto * decode_error = std::get_if<abi::DecodeError>(&error.cause))
        {
            out["kind"] = std::format("{}", decode_error->kind);
            out["message"] = decode_error->message;
            return out;
        }

        const auto & normalize_error = std::get<record::NormalizeError>(error.cause);
        out["kind"] = std::format("{}", normalize_error.kind);
        if(normalize_error.kind == record::NormalizeError::Kind::UNSUPPORTED_FUNCTION)
        {
            out["function"] = normalize_error.function_name;
        }
        else
        {
            out["missing_fields"] = normalize_error.missing_fields;
        }
        return out;
    }
}
