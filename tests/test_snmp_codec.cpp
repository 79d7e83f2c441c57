#include <gtest/gtest.h>

#include <algorithm>

#include "collector/snmp_codec.hpp"

using namespace snmp;

namespace {

std::vector<std::uint8_t> bytes(std::initializer_list<int> v)
{
    std::vector<std::uint8_t> out;
    for (int b : v) out.push_back(static_cast<std::uint8_t>(b));
    return out;
}

// 取出单个 varbind 的值编码：跳过固定的报文头部
std::vector<std::uint8_t> encodedValue(const Value& value)
{
    Message msg;
    msg.pdu = PduType::Response;
    msg.varbinds.push_back({"1.3.6", value});
    auto buf = encode(msg);
    // 值位于 OID 06 02 2b 06 之后
    static const std::vector<std::uint8_t> oid = bytes({0x06, 0x02, 0x2b, 0x06});
    auto it = std::search(buf.begin(), buf.end(), oid.begin(), oid.end());
    return {it + static_cast<std::ptrdiff_t>(oid.size()), buf.end()};
}

} // namespace

TEST(SnmpCodec, GetRequestMatchesReferenceBytes)
{
    auto msg = makeGetRequest("public", 1, {"1.3.6.1.2.1.1.3.0"});
    auto expected = bytes({
        0x30, 0x26, 0x02, 0x01, 0x01, 0x04, 0x06, 0x70, 0x75, 0x62, 0x6c, 0x69, 0x63,
        0xa0, 0x19, 0x02, 0x01, 0x01, 0x02, 0x01, 0x00, 0x02, 0x01, 0x00,
        0x30, 0x0e, 0x30, 0x0c, 0x06, 0x08, 0x2b, 0x06, 0x01, 0x02, 0x01, 0x01, 0x03, 0x00,
        0x05, 0x00,
    });
    EXPECT_EQ(encode(msg), expected);
}

TEST(SnmpCodec, IntegersUseMinimalTwosComplement)
{
    EXPECT_EQ(encodedValue(Value::ofInteger(0)),    bytes({0x02, 0x01, 0x00}));
    EXPECT_EQ(encodedValue(Value::ofInteger(-1)),   bytes({0x02, 0x01, 0xff}));
    EXPECT_EQ(encodedValue(Value::ofInteger(127)),  bytes({0x02, 0x01, 0x7f}));
    EXPECT_EQ(encodedValue(Value::ofInteger(128)),  bytes({0x02, 0x02, 0x00, 0x80}));
    EXPECT_EQ(encodedValue(Value::ofInteger(-129)), bytes({0x02, 0x02, 0xff, 0x7f}));
}

TEST(SnmpCodec, UnsignedWithHighBitGetsLeadingZero)
{
    EXPECT_EQ(encodedValue(Value::ofUnsigned(ValueType::Counter32, 0xffffffffu)),
              bytes({0x41, 0x05, 0x00, 0xff, 0xff, 0xff, 0xff}));
    EXPECT_EQ(encodedValue(Value::ofUnsigned(ValueType::Gauge32, 5)), bytes({0x42, 0x01, 0x05}));
}

TEST(SnmpCodec, ResponseDecodesEveryValueType)
{
    Message msg;
    msg.community = "secret";
    msg.pdu = PduType::Response;
    msg.requestId = 0x12345678;

    Value oid;
    oid.type = ValueType::ObjectId;
    oid.text = "1.3.6.1.4.1.41112";
    Value ip;
    ip.type = ValueType::IpAddress;
    ip.text = "10.0.0.6";

    msg.varbinds = {
        {"1.3.6.1.2.1.1.1.0", Value::ofString("AirFiber 5X")},
        {"1.3.6.1.2.1.1.3.0", Value::ofUnsigned(ValueType::TimeTicks, 123456)},
        {"1.3.6.1.2.1.1.2.0", oid},
        {"1.3.6.1.2.1.4.20.1.1.10.0.0.6", ip},
        {"1.3.6.1.2.1.31.1.1.1.6.1", Value::ofUnsigned(ValueType::Counter64, 0x1234567890ull)},
        {"1.3.6.1.4.1.41112.1.4.5.1.5.1", Value::ofInteger(-61)},
        {"1.3.6.1.4.1.41112.1.4.5.1.8.1", Value::exception(ValueType::NoSuchInstance)},
    };

    auto back = decode(encode(msg));
    EXPECT_EQ(back.version, kVersion2c);
    EXPECT_EQ(back.community, "secret");
    EXPECT_EQ(back.pdu, PduType::Response);
    EXPECT_EQ(back.requestId, 0x12345678);
    ASSERT_EQ(back.varbinds.size(), 7u);

    EXPECT_EQ(back.varbinds[0].value.toString(), "AirFiber 5X");
    EXPECT_EQ(back.varbinds[1].value.type, ValueType::TimeTicks);
    EXPECT_EQ(back.varbinds[1].value.unsignedValue, 123456u);
    EXPECT_EQ(back.varbinds[2].value.text, "1.3.6.1.4.1.41112");
    EXPECT_EQ(back.varbinds[3].value.toString(), "10.0.0.6");
    EXPECT_EQ(back.varbinds[4].value.unsignedValue, 0x1234567890ull);
    EXPECT_EQ(back.varbinds[5].value.integer, -61);
    EXPECT_TRUE(back.varbinds[6].value.isAbsent());
    EXPECT_EQ(back.varbinds[5].oid, "1.3.6.1.4.1.41112.1.4.5.1.5.1");
}

TEST(SnmpCodec, TruncatedInputThrows)
{
    auto buf = encode(makeGetRequest("public", 7, {"1.3.6.1.2.1.1.3.0"}));
    for (std::size_t cut : {std::size_t{0}, std::size_t{1}, std::size_t{5}, buf.size() - 1}) {
        EXPECT_THROW(decode(buf.data(), cut), DecodeError) << "cut at " << cut;
    }
}

TEST(SnmpCodec, TrailingBytesAreRejected)
{
    auto buf = encode(makeGetRequest("public", 7, {"1.3.6.1.2.1.1.3.0"}));
    buf.push_back(0x00);
    EXPECT_THROW(decode(buf), DecodeError);
}

TEST(SnmpCodec, IndefiniteLengthIsRejected)
{
    EXPECT_THROW(decode(bytes({0x30, 0x80, 0x00, 0x00})), DecodeError);
}

TEST(SnmpCodec, ParseOid)
{
    EXPECT_EQ(formatOid(parseOid(".1.3.6.1.2.1.1.3.0")), "1.3.6.1.2.1.1.3.0");
    EXPECT_THROW(parseOid(""), std::invalid_argument);
    EXPECT_THROW(parseOid("1"), std::invalid_argument);
    EXPECT_THROW(parseOid("1.3..6"), std::invalid_argument);
    EXPECT_THROW(parseOid("1.3.x"), std::invalid_argument);
    EXPECT_THROW(parseOid("3.1"), std::invalid_argument);
    EXPECT_THROW(parseOid("1.3.6.99999999999"), std::invalid_argument);
}

TEST(SnmpCodec, ErrorStatusNames)
{
    EXPECT_STREQ(errorStatusName(0), "noError");
    EXPECT_STREQ(errorStatusName(2), "noSuchName");
    EXPECT_STREQ(errorStatusName(5), "genErr");
    EXPECT_STREQ(errorStatusName(99), "unknownError");
}
