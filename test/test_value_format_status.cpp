#include "StatusCodes.h"
#include "ValueFormat.h"

#include <gtest/gtest.h>

TEST(ValueFormat, ByteStringDependsOnDeclaredType) {
    const UAValue v = UAScalar{ ByteString{ { 0x43, 0x45, 0xDE } } };
    EXPECT_EQ(formatValue(v, BuiltinType::ByteString), "4345de");
    EXPECT_EQ(formatValue(v, BuiltinType::Unknown), "43 45 DE");

    const UAValue text = UAScalar{ ByteString{ { 'o', 'k' } } };
    EXPECT_EQ(formatValue(text, BuiltinType::String), "ok");
}

TEST(ValueFormat, ScalarsArraysAndNull) {
    EXPECT_EQ(formatValue(UAValue{}), "<null>");
    EXPECT_EQ(formatValue(UAScalar{ true }), "true");
    EXPECT_EQ(formatValue(UAScalar{ uint8_t(200) }), "200");
    EXPECT_EQ(formatValue(UAScalar{ int8_t(-5) }), "-5");
    EXPECT_EQ(formatValue(UAScalar{ 1.5 }), "1.5");
    EXPECT_EQ(formatValue(UAScalar{ LocalizedText{ "en", "Hi" } }), "Hi");
    EXPECT_EQ(formatValue(UAScalar{ NodeIdValue{ "i=85" } }), "i=85");
    EXPECT_EQ(formatValue(UAArray{ UAScalar{ int32_t(1) }, UAScalar{ int32_t(2) } }), "[1, 2]");
    EXPECT_EQ(formatValue(UAScalar{ DateTime{ 0 } }), "1970-01-01 00:00:00.000");
}

TEST(ValueFormat, DataTypeNames) {
    EXPECT_EQ(dataTypeNameFromId("i=6"), "Int32");
    EXPECT_EQ(dataTypeNameFromId("i=15"), "ByteString");
    EXPECT_EQ(dataTypeNameFromId("ns=2;i=3002"), "ns=2;i=3002");
    EXPECT_EQ(dataTypeNameFromId("i=29"), "i=29");

    EXPECT_EQ(builtinFromName("float32"), BuiltinType::Float);
    EXPECT_EQ(builtinFromName("Bool"), BuiltinType::Boolean);
    EXPECT_EQ(builtinFromName("quaternion"), BuiltinType::Unknown);
    EXPECT_STREQ(builtinTypeName(BuiltinType::UInt64), "UInt64");
}

TEST(ValueFormat, AccessLevelNames) {
    EXPECT_EQ(formatAccessLevel(0), "None");
    EXPECT_EQ(formatAccessLevel(0x03), "Read, Write");
    EXPECT_EQ(formatAccessLevel(0x05), "Read, HistoryRead");
}

TEST(ValueFormat, ClockHasMillisecondResolution) {
    const std::string c = formatClock(nowUnixMs());
    ASSERT_EQ(c.size(), 12u);
    EXPECT_EQ(c[2], ':');
    EXPECT_EQ(c[8], '.');
}

TEST(StatusCodes, DecodeGood) {
    const DecodedStatus d = decodeStatusCode(UaStatus::Good);
    EXPECT_EQ(d.severity, "Good");
    EXPECT_EQ(d.symbolicName, "Good");
    EXPECT_EQ(d.rawCode, "0x00000000");
    EXPECT_EQ(d.subCode, 0);
}

TEST(StatusCodes, DecodeBadWithInfoBits) {
    const DecodedStatus d = decodeStatusCode(UaStatus::BadTypeMismatch | 0xC000u | 0x0012u);
    EXPECT_EQ(d.severity, "Bad");
    EXPECT_EQ(d.symbolicName, "BadTypeMismatch");
    EXPECT_EQ(d.subCode, 0x0074);
    EXPECT_TRUE(d.structureChanged);
    EXPECT_TRUE(d.semanticsChanged);
    EXPECT_EQ(d.infoBits, 0x0012);
    EXPECT_EQ(d.rawCode, "0x8074C012");
}

TEST(StatusCodes, UncertainAndUnknownCodes) {
    EXPECT_EQ(decodeStatusCode(UaStatus::UncertainInitialValue).severity, "Uncertain");

    const DecodedStatus u = decodeStatusCode(0x80FF0000u);
    EXPECT_EQ(u.severity, "Bad");
    EXPECT_EQ(u.symbolicName, "0x80FF0000");
    EXPECT_EQ(statusToString(0x80FF0000u), "Unknown (0x80FF0000)");
    EXPECT_EQ(statusToString(UaStatus::BadNotWritable), "BadNotWritable (0x803B0000)");

    EXPECT_EQ(decodeStatusCode(0xC0000000u).severity, "Unknown");
}
