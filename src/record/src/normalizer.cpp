#include "normalizer.hpp"

#include <vector>

namespace ddc::record
{
    namespace
    {
        /*
            Field names of one historical schema.
        */
        struct SchemaFields
        {
            SchemaShape shape;

            std::vector<std::string> token_path;
            std::vector<std::string> rewards_path;

            std::string name;
            std::string symbol;
            std::string image;
            std::string metadata;
            std::string context;
            std::string originating_chain_id;
            std::string creator_reward_recipient;
        };

        const SchemaFields & _nestedSchema()
        {
            static const SchemaFields schema{
                SchemaShape::NAMED_STRUCT,
                {"deploymentConfig", "tokenConfig"},
                {"deploymentConfig", "rewardsConfig"},
                "name", "symbol", "image", "metadata", "context", "originatingChainId", "creatorRewardRecipient"
            };
            return schema;
        }

        const SchemaFields & _flatSchema()
        {
            static const SchemaFields schema{
                SchemaShape::NAMED_STRUCT,
                {"tokenConfig"},
                {"rewardsConfig"},
                "name", "symbol", "image", "metadata", "context", "originatingChainId", "creatorRewardRecipient"
            };
            return schema;
        }

        const SchemaFields & _positionalSchema()
        {
            static const SchemaFields schema{
                SchemaShape::POSITIONAL,
                {"token"},
                {"rewards"},
                "name", "symbol", "image_url", "metadata", "context", "originating_chain_id", "creator_reward_recipient"
            };
            return schema;
        }

        const SchemaFields & _detectSchema(const abi::Struct & arguments)
        {
            if(arguments.find("deploymentConfig") != nullptr)
            {
                return _nestedSchema();
            }

            if(arguments.find("tokenConfig") != nullptr || arguments.find("rewardsConfig") != nullptr)
            {
                return _flatSchema();
            }

            if(arguments.find("token") != nullptr || arguments.find("rewards") != nullptr)
            {
                return _positionalSchema();
            }

            return _nestedSchema();
        }

        const abi::Struct * _findStruct(const abi::Struct & root, const std::vector<std::string> & path)
        {
            const abi::Struct * current = &root;
            for(const std::string & name : path)
            {
                const abi::Value * value = current->find(name);
                if(value == nullptr)
                {
                    return nullptr;
                }

                current = value->asStruct();
                if(current == nullptr)
                {
                    return nullptr;
                }
            }
            return current;
        }

        std::optional<std::string> _text(const abi::Struct * parent, const std::string & name)
        {
            if(parent == nullptr)
            {
                return std::nullopt;
            }

            const abi::Value * value = parent->find(name);
            if(value == nullptr)
            {
                return std::nullopt;
            }
            return abi::toString(*value);
        }

        std::optional<std::string> _required(const abi::Struct * parent, const std::string & name, std::vector<std::string> & missing)
        {
            auto value = _text(parent, name);
            if(!value)
            {
                missing.push_back(name);
            }
            return value;
        }
    }

    NormalizeResult<DeploymentRecord> normalize(const abi::DecodedCall & call)
    {
        if(call.function_name && *call.function_name != DEPLOY_FUNCTION_NAME)
        {
            return std::unexpected(NormalizeError{
                .kind = NormalizeError::Kind::UNSUPPORTED_FUNCTION,
                .function_name = *call.function_name
            });
        }

        const SchemaFields & schema = _detectSchema(call.arguments);

        const abi::Struct * token = _findStruct(call.arguments, schema.token_path);
        const abi::Struct * rewards = _findStruct(call.arguments, schema.rewards_path);

        std::vector<std::string> missing;

        std::optional<std::string> name, symbol, metadata, context, recipient;

        if(token == nullptr)
        {
            missing.push_back(schema.token_path.back());
        }
        else
        {
            name = _required(token, schema.name, missing);
            symbol = _required(token, schema.symbol, missing);
            metadata = _required(token, schema.metadata, missing);
            context = _required(token, schema.context, missing);
        }

        if(rewards == nullptr)
        {
            missing.push_back(schema.rewards_path.back());
        }
        else
        {
            recipient = _required(rewards, schema.creator_reward_recipient, missing);
        }

        if(!missing.empty())
        {
            return std::unexpected(NormalizeError{
                .kind = NormalizeError::Kind::MISSING_FIELDS,
                .missing_fields = std::move(missing)
            });
        }

        DeploymentRecord record;
        record.shape = schema.shape;

        record.token.name = std::move(*name);
        record.token.symbol = std::move(*symbol);
        record.token.image_url = _text(token, schema.image);
        record.token.originating_chain_id = _text(token, schema.originating_chain_id);
        record.token.metadata = extractField(*metadata);
        record.token.context = extractField(*context);

        record.rewards.creator_reward_recipient = std::move(*recipient);

        record.context_id = contextId(record.token.context);
        return record;
    }
}
