#include "unit-tests.hpp"

using namespace ddc;
using namespace ddc::tests;

namespace
{
    abi::FunctionInterface makeStringInterface()
    {
        return makeInterface(json::parse(R"({
            "type": "function",
            "name": "f",
            "inputs": [{"name": "s", "type": "string"}]
        })"));
    }
}

TEST_F(UnitTest, AbiDecoder_DecodeCall_StaticArguments)
{
    auto transfer = makeInterface(json::parse(R"({
        "type": "function",
        "name": "transfer",
        "inputs": [{"name": "to", "type": "address"}, {"name": "amount", "type": "uint256"}]
    })"));
    transfer.selector = std::array<std::uint8_t, 4>{0xa9, 0x05, 0x9c, 0xbb};

    const auto data = evmc::from_hex(
        "a9059cbb"
        "000000000000000000000000000000000000000000000000000000000000dEaD"
        "00000000000000000000000000000000000000000000000000000000000f4240").value();

    auto call_res = abi::decodeCall(transfer, data.data(), data.size());
    ASSERT_TRUE(call_res.has_value()) << call_res.error().message;

    EXPECT_EQ(call_res->function_name, "transfer");
    ASSERT_NE(call_res->arguments.find("to"), nullptr);
    EXPECT_EQ(abi::toString(*call_res->arguments.find("to")), "0x000000000000000000000000000000000000dead");
    EXPECT_EQ(abi::toString(*call_res->arguments.find("amount")), "1000000");
}

TEST_F(UnitTest, AbiDecoder_DecodeCall_DynamicString)
{
    std::vector<std::uint8_t> data(4, 0);
    appendWord(data, 0x20);
    appendWord(data, 5);
    const std::string hello = "hello";
    data.insert(data.end(), hello.begin(), hello.end());
    data.resize(data.size() + 27, 0);

    auto call_res = abi::decodeCall(makeStringInterface(), data);
    ASSERT_TRUE(call_res.has_value()) << call_res.error().message;
    ASSERT_NE(call_res->arguments.find("s"), nullptr);
    EXPECT_EQ(*call_res->arguments.find("s")->asString(), "hello");
}

TEST_F(UnitTest, AbiDecoder_DecodeCall_InvalidUtf8IsReplaced)
{
    std::vector<std::uint8_t> data(4, 0);
    appendWord(data, 0x20);
    appendWord(data, 3);
    data.push_back('a');
    data.push_back(0xFF);
    data.push_back('b');
    data.resize(data.size() + 29, 0);

    auto call_res = abi::decodeCall(makeStringInterface(), data);
    ASSERT_TRUE(call_res.has_value());
    EXPECT_EQ(*call_res->arguments.find("s")->asString(), "a\xEF\xBF\xBD" "b");
}

TEST_F(UnitTest, AbiDecoder_DecodeCall_TooShortForSelector)
{
    const std::vector<std::uint8_t> data{0xe9, 0x11};

    auto call_res = abi::decodeCall(makeStringInterface(), data);
    ASSERT_FALSE(call_res.has_value());
    EXPECT_EQ(call_res.error().kind, abi::DecodeError::Kind::TRUNCATED_DATA);
}

TEST_F(UnitTest, AbiDecoder_DecodeCall_StringLongerThanBuffer)
{
    std::vector<std::uint8_t> data(4, 0);
    appendWord(data, 0x20);
    appendWord(data, 100);
    data.resize(data.size() + 10, 'x');

    auto call_res = abi::decodeCall(makeStringInterface(), data);
    ASSERT_FALSE(call_res.has_value());
    EXPECT_EQ(call_res.error().kind, abi::DecodeError::Kind::TRUNCATED_DATA);
}

TEST_F(UnitTest, AbiDecoder_DecodeCall_OffsetOutsideBuffer)
{
    std::vector<std::uint8_t> data(4, 0);
    appendWord(data, 0x1000);
    appendWord(data, 0);

    auto call_res = abi::decodeCall(makeStringInterface(), data);
    ASSERT_FALSE(call_res.has_value());
    EXPECT_EQ(call_res.error().kind, abi::DecodeError::Kind::INVALID_OFFSET);
}

TEST_F(UnitTest, AbiDecoder_DecodeCall_HugeArrayLengthIsRejected)
{
    auto values = makeInterface(json::parse(R"({
        "type": "function",
        "name": "g",
        "inputs": [{"name": "values", "type": "uint256[]"}]
    })"));

    std::vector<std::uint8_t> data(4, 0);
    appendWord(data, 0x20);
    appendWord(data, 1'000'000);
    appendWord(data, 1);

    auto call_res = abi::decodeCall(values, data);
    ASSERT_FALSE(call_res.has_value());
    EXPECT_EQ(call_res.error().kind, abi::DecodeError::Kind::TRUNCATED_DATA);
}

TEST_F(UnitTest, AbiDecoder_DecodeCall_AliasedElementsAreRejected)
{
    const auto labels = makeInterface(json::parse(R"({
        "type": "function",
        "name": "h",
        "inputs": [{"name": "labels", "type": "string[]"}]
    })"));

    constexpr std::size_t count = 20;
    constexpr std::size_t length = 200;

    std::vector<std::uint8_t> data(4, 0);
    appendWord(data, 0x20);
    appendWord(data, count);
    // every element points at the same string right after the offsets
    for(std::size_t i = 0; i < count; ++i)
    {
        appendWord(data, 32 * count);
    }
    appendWord(data, length);
    data.resize(data.size() + 224, 'a');

    auto call_res = abi::decodeCall(labels, data);
    ASSERT_FALSE(call_res.has_value());
    EXPECT_EQ(call_res.error().kind, abi::DecodeError::Kind::INVALID_OFFSET);

    // the same string referenced once decodes
    std::vector<std::uint8_t> single(4, 0);
    appendWord(single, 0x20);
    appendWord(single, 1);
    appendWord(single, 32);
    appendWord(single, length);
    single.resize(single.size() + 224, 'a');

    auto single_res = abi::decodeCall(labels, single);
    ASSERT_TRUE(single_res.has_value()) << single_res.error().message;
    const abi::List * values = single_res->arguments.find("labels")->asList();
    ASSERT_NE(values, nullptr);
    ASSERT_EQ(values->size(), 1u);
    EXPECT_EQ(*values->front().asString(), std::string(length, 'a'));
}

TEST_F(UnitTest, AbiDecoder_DeployToken_RoundTrip)
{
    const abi::FunctionInterface deploy = loadDeployInterface();
    const abi::Struct arguments = makeDeployArguments();

    auto data_res = abi::encodeCall(deploy, arguments);
    ASSERT_TRUE(data_res.has_value()) << data_res.error().message;
    ASSERT_GE(data_res->size(), 4u);
    EXPECT_EQ((*data_res)[0], 0xe9);
    EXPECT_EQ((*data_res)[3], 0x4e);

    auto call_res = abi::decodeCall(deploy, *data_res);
    ASSERT_TRUE(call_res.has_value()) << call_res.error().message;
    EXPECT_EQ(call_res->function_name, "deployToken");
    EXPECT_EQ(call_res->arguments, arguments);

    const abi::Value * tick = abi::findPath(call_res->arguments, {"deploymentConfig", "poolConfig", "tickIfToken0IsNewToken"});
    ASSERT_NE(tick, nullptr);
    EXPECT_EQ(abi::toString(*tick), "-230400");
}

TEST_F(UnitTest, AbiDecoder_DeployToken_SelectorMismatch)
{
    const abi::FunctionInterface deploy = loadDeployInterface();

    auto data_res = abi::encodeCall(deploy, makeDeployArguments());
    ASSERT_TRUE(data_res.has_value());
    (*data_res)[0] ^= 0xFF;

    auto call_res = abi::decodeCall(deploy, *data_res);
    ASSERT_FALSE(call_res.has_value());
    EXPECT_EQ(call_res.error().kind, abi::DecodeError::Kind::SELECTOR_MISMATCH);
}

TEST_F(UnitTest, AbiDecoder_DeployToken_TruncatedTail)
{
    const abi::FunctionInterface deploy = loadDeployInterface();

    auto data_res = abi::encodeCall(deploy, makeDeployArguments());
    ASSERT_TRUE(data_res.has_value());

    // drops the padded bytes of the last string (context)
    data_res->resize(data_res->size() - 32);

    auto call_res = abi::decodeCall(deploy, *data_res);
    ASSERT_FALSE(call_res.has_value());
    EXPECT_EQ(call_res.error().kind, abi::DecodeError::Kind::TRUNCATED_DATA);
}

TEST_F(UnitTest, AbiDecoder_ArraysOfTuples_RoundTrip)
{
    const auto batch = makeInterface(json::parse(R"({
        "type": "function",
        "name": "batch",
        "inputs": [
            {"name": "ids", "type": "uint64[]"},
            {"name": "items", "type": "tuple[]", "components": [
                {"name": "label", "type": "string"},
                {"name": "enabled", "type": "bool"}
            ]},
            {"name": "owners", "type": "address[2]"},
            {"name": "", "type": "bytes"}
        ]
    })"));

    abi::Struct first;
    first.set("label", text("alpha"));
    first.set("enabled", abi::Value{true});

    abi::Struct second;
    second.set("label", text(""));
    second.set("enabled", abi::Value{false});

    abi::Struct arguments;
    arguments.set("ids", abi::Value{abi::List{uintValue(1), uintValue(2), uintValue(3)}});
    arguments.set("items", abi::Value{abi::List{abi::Value{first}, abi::Value{second}}});
    arguments.set("owners", abi::Value{abi::List{
        addressValue("0x00000000000000000000000000000000000000a1"),
        addressValue("0x00000000000000000000000000000000000000b2")}});
    arguments.set("3", abi::Value{abi::Bytes{0xde, 0xad, 0xbe, 0xef}});

    auto data_res = abi::encodeCall(batch, arguments);
    ASSERT_TRUE(data_res.has_value()) << data_res.error().message;

    auto call_res = abi::decodeCall(batch, *data_res);
    ASSERT_TRUE(call_res.has_value()) << call_res.error().message;
    EXPECT_EQ(call_res->arguments, arguments);

    const abi::List * items = call_res->arguments.find("items")->asList();
    ASSERT_NE(items, nullptr);
    ASSERT_EQ(items->size(), 2u);
    EXPECT_EQ(*(*items)[0].asStruct()->find("label")->asString(), "alpha");
}

TEST_F(UnitTest, AbiEncoder_EncodeCall_RejectsMismatchedValue)
{
    abi::Struct arguments;
    arguments.set("s", uintValue(7));

    auto data_res = abi::encodeCall(makeStringInterface(), arguments);
    ASSERT_FALSE(data_res.has_value());
    EXPECT_EQ(data_res.error().kind, abi::DecodeError::Kind::SHAPE_MISMATCH);

    auto missing_res = abi::encodeCall(makeStringInterface(), abi::Struct{});
    ASSERT_FALSE(missing_res.has_value());
    EXPECT_EQ(missing_res.error().kind, abi::DecodeError::Kind::SHAPE_MISMATCH);
}
