#include "unit-tests.hpp"

using namespace ddc;
using namespace ddc::tests;

namespace
{
    abi::DecodedCall makeNamedCall(const DeployFields & fields = {})
    {
        return abi::DecodedCall{"deployToken", makeDeployArguments(fields)};
    }

    abi::Struct & tokenConfigOf(abi::DecodedCall & call)
    {
        abi::Value & deployment = call.arguments.values.at(0);
        return std::get<abi::Struct>(std::get<abi::Struct>(deployment.data).values.at(0).data);
    }

    void eraseField(abi::Struct & target, const std::string & name)
    {
        for(std::size_t i = 0; i < target.names.size(); ++i)
        {
            if(target.names[i] == name)
            {
                target.names.erase(target.names.begin() + i);
                target.values.erase(target.values.begin() + i);
                return;
            }
        }
    }
}

TEST_F(UnitTest, Normalizer_Normalize_NamedStruct)
{
    auto record_res = record::normalize(makeNamedCall());
    ASSERT_TRUE(record_res.has_value());

    const record::DeploymentRecord & record = *record_res;
    EXPECT_EQ(record.shape, record::SchemaShape::NAMED_STRUCT);
    EXPECT_EQ(record.token.name, "DOGE");
    EXPECT_EQ(record.token.symbol, "DOGE");
    EXPECT_EQ(record.token.image_url, "https://img/doge.png");
    EXPECT_EQ(record.token.originating_chain_id, "8453");

    ASSERT_TRUE(record.token.metadata.has_value());
    ASSERT_TRUE(record.token.metadata->isParsed());
    EXPECT_EQ(*record.token.metadata->parsed(), json::parse(R"({"a":1})"));

    EXPECT_EQ(record.context_id, "xyz");
    EXPECT_EQ(utils::toLower(record.rewards.creator_reward_recipient), "0xabcdef0000000000000000000000000000000001");
    EXPECT_FALSE(record.sender.has_value());
}

TEST_F(UnitTest, Normalizer_Normalize_UnsupportedFunction)
{
    auto record_res = record::normalize(abi::DecodedCall{"transfer", abi::Struct{}});
    ASSERT_FALSE(record_res.has_value());
    EXPECT_EQ(record_res.error().kind, record::NormalizeError::Kind::UNSUPPORTED_FUNCTION);
    EXPECT_EQ(record_res.error().function_name, "transfer");

    // a complete deploy shape does not change the verdict
    auto shaped_res = record::normalize(abi::DecodedCall{"transfer", makeDeployArguments()});
    ASSERT_FALSE(shaped_res.has_value());
    EXPECT_EQ(shaped_res.error().kind, record::NormalizeError::Kind::UNSUPPORTED_FUNCTION);
}

TEST_F(UnitTest, Normalizer_Normalize_MissingSymbol)
{
    abi::DecodedCall call = makeNamedCall();
    eraseField(tokenConfigOf(call), "symbol");

    auto record_res = record::normalize(call);
    ASSERT_FALSE(record_res.has_value());
    EXPECT_EQ(record_res.error().kind, record::NormalizeError::Kind::MISSING_FIELDS);
    EXPECT_EQ(record_res.error().missing_fields, std::vector<std::string>{"symbol"});
}

TEST_F(UnitTest, Normalizer_Normalize_ReportsEveryMissingField)
{
    abi::DecodedCall call = makeNamedCall();
    eraseField(tokenConfigOf(call), "name");
    eraseField(tokenConfigOf(call), "context");

    abi::Struct & deployment = std::get<abi::Struct>(call.arguments.values.at(0).data);
    eraseField(deployment, "rewardsConfig");

    auto record_res = record::normalize(call);
    ASSERT_FALSE(record_res.has_value());
    const std::vector<std::string> expected{"name", "context", "rewardsConfig"};
    EXPECT_EQ(record_res.error().missing_fields, expected);
}

TEST_F(UnitTest, Normalizer_Normalize_OptionalFieldsMayBeMissing)
{
    abi::DecodedCall call = makeNamedCall();
    eraseField(tokenConfigOf(call), "image");
    eraseField(tokenConfigOf(call), "originatingChainId");

    auto record_res = record::normalize(call);
    ASSERT_TRUE(record_res.has_value());
    EXPECT_FALSE(record_res->token.image_url.has_value());
    EXPECT_FALSE(record_res->token.originating_chain_id.has_value());
}

TEST_F(UnitTest, Normalizer_Normalize_FlatNamedStruct)
{
    abi::DecodedCall call = makeNamedCall();
    const abi::Struct deployment = std::get<abi::Struct>(call.arguments.values.at(0).data);

    abi::Struct flat;
    flat.set("tokenConfig", *deployment.find("tokenConfig"));
    flat.set("rewardsConfig", *deployment.find("rewardsConfig"));

    auto record_res = record::normalize(abi::DecodedCall{"deployToken", flat});
    ASSERT_TRUE(record_res.has_value());
    EXPECT_EQ(record_res->shape, record::SchemaShape::NAMED_STRUCT);
    EXPECT_EQ(record_res->context_id, "xyz");

    flat = abi::Struct{};
    flat.set("tokenConfig", *deployment.find("tokenConfig"));
    auto missing_res = record::normalize(abi::DecodedCall{"deployToken", flat});
    ASSERT_FALSE(missing_res.has_value());
    EXPECT_EQ(missing_res.error().missing_fields, std::vector<std::string>{"rewardsConfig"});
}

TEST_F(UnitTest, Normalizer_Normalize_Positional)
{
    auto call_res = legacy::decode(makeLegacyPayload(), legacy::LegacyLayout{});
    ASSERT_TRUE(call_res.has_value());

    auto record_res = record::normalize(*call_res);
    ASSERT_TRUE(record_res.has_value());
    EXPECT_EQ(record_res->shape, record::SchemaShape::POSITIONAL);
    EXPECT_EQ(record_res->token.name, "DOGE");
    EXPECT_EQ(record_res->token.image_url, "https://img/doge.png");
    EXPECT_EQ(record_res->token.originating_chain_id, "8453");
    EXPECT_EQ(record_res->context_id, "xyz");
    EXPECT_EQ(record_res->rewards.creator_reward_recipient, "0xABCdef0000000000000000000000000000000001");
}

TEST_F(UnitTest, Normalizer_Normalize_MalformedMetadataDoesNotAffectContext)
{
    DeployFields fields;
    fields.metadata = R"({"a":)";

    auto record_res = record::normalize(makeNamedCall(fields));
    ASSERT_TRUE(record_res.has_value());

    ASSERT_TRUE(record_res->token.metadata.has_value());
    ASSERT_FALSE(record_res->token.metadata->isParsed());
    EXPECT_EQ(record_res->token.metadata->raw()->text, R"({"a":)");
    EXPECT_TRUE(record_res->token.metadata->raw()->decode_failed);

    ASSERT_TRUE(record_res->token.context.has_value());
    EXPECT_TRUE(record_res->token.context->isParsed());
    EXPECT_EQ(record_res->context_id, "xyz");
}

TEST_F(UnitTest, Normalizer_Normalize_EmptyEmbeddedTextIsAbsent)
{
    DeployFields fields;
    fields.metadata = "";
    fields.context = "   ";

    auto record_res = record::normalize(makeNamedCall(fields));
    ASSERT_TRUE(record_res.has_value());
    EXPECT_FALSE(record_res->token.metadata.has_value());
    EXPECT_FALSE(record_res->token.context.has_value());
    EXPECT_FALSE(record_res->context_id.has_value());
}

TEST_F(UnitTest, Normalizer_Normalize_IsDeterministic)
{
    const abi::DecodedCall call = makeNamedCall();

    auto first = record::normalize(call);
    auto second = record::normalize(call);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

TEST_F(UnitTest, Normalizer_Normalize_UnnamedCallIsDeploy)
{
    abi::DecodedCall call = makeNamedCall();
    call.function_name.reset();

    EXPECT_TRUE(record::normalize(call).has_value());
}
