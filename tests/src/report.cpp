#include "unit-tests.hpp"

using namespace ddc;
using namespace ddc::tests;

TEST_F(UnitTest, Report_ToJson_Record)
{
    record::DeploymentRecord record;
    record.token.name = "DOGE";
    record.token.symbol = "DOGE";
    record.token.metadata = record::extractField("{broken");
    record.token.context = record::extractField(R"({"interface":"app"})");
    record.rewards.creator_reward_recipient = "0xabcdef0000000000000000000000000000000001";
    record.sender = record::SenderInfo{"0x00000000000000000000000000000000000000a1", "Example deployer"};

    const json out = report::toJson(record);

    EXPECT_EQ(out["schema"], "named");
    EXPECT_EQ(out["context_id"], report::NOT_AVAILABLE);
    EXPECT_TRUE(out["token"]["image_url"].is_null());
    EXPECT_EQ(out["token"]["metadata"]["raw"], "{broken");
    EXPECT_EQ(out["token"]["metadata"]["decode_failed"], true);
    EXPECT_EQ(out["token"]["context"]["interface"], "app");
    EXPECT_EQ(out["sender"]["label"], "Example deployer");
}

TEST_F(UnitTest, Report_ToJson_Error)
{
    engine::EngineError error{
        engine::EngineError::Stage::NORMALIZE,
        classify::PayloadKind::ABI_BINARY,
        record::NormalizeError{.kind = record::NormalizeError::Kind::MISSING_FIELDS, .missing_fields = {"symbol"}}
    };

    const json out = report::toJson(error);
    EXPECT_EQ(out["stage"], "normalize");
    EXPECT_EQ(out["payload"], "ABI call data");
    EXPECT_EQ(out["missing_fields"], json::array({"symbol"}));
    EXPECT_NE(engine::describe(error).find("symbol"), std::string::npos);
}
