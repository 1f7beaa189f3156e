#include <gtest/gtest.h>
#include "geodata/codec.hpp"
#include "geodata/error.hpp"

using namespace geodata;

// ---- Parse tests ----

TEST(CodecParse, Object) {
    auto j = Codec::parse(R"({"type":"Feature","id":"a1","created":1270000000})");
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j["type"], "Feature");
    EXPECT_EQ(j["id"], "a1");
    EXPECT_EQ(j["created"].get<int64_t>(), 1270000000);
}

TEST(CodecParse, Array) {
    auto j = Codec::parse(R"([{"name":"San Francisco"},{"name":"Oakland"}])");
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2u);
    EXPECT_EQ(j[1]["name"], "Oakland");
}

TEST(CodecParse, CoordinatesStayFloatingPoint) {
    auto j = Codec::parse(R"({"coordinates":[-122.419, 37.775]})");
    EXPECT_TRUE(j["coordinates"][0].is_number_float());
    EXPECT_DOUBLE_EQ(j["coordinates"][0].get<double>(), -122.419);
    EXPECT_DOUBLE_EQ(j["coordinates"][1].get<double>(), 37.775);
}

TEST(CodecParse, NestedNullAndBool) {
    auto j = Codec::parse(R"({"properties":{"open":true,"closed":false,"owner":null}})");
    EXPECT_TRUE(j["properties"]["open"].get<bool>());
    EXPECT_FALSE(j["properties"]["closed"].get<bool>());
    EXPECT_TRUE(j["properties"]["owner"].is_null());
}

TEST(CodecParse, EscapedStrings) {
    auto j = Codec::parse(R"({"name":"Café \"Noir\""})");
    EXPECT_EQ(j["name"], "Caf\xC3\xA9 \"Noir\"");
}

TEST(CodecParse, EmptyBody) {
    EXPECT_THROW(Codec::parse(""), GeoMalformedResponseError);
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), GeoMalformedResponseError);
}

TEST(CodecParse, HtmlErrorPage) {
    EXPECT_THROW(Codec::parse("<html><body>502 Bad Gateway</body></html>"), GeoMalformedResponseError);
}

TEST(CodecParse, TrailingContentRejected) {
    EXPECT_THROW(Codec::parse("[1,2] ]]]"), GeoMalformedResponseError);
    EXPECT_THROW(Codec::parse(R"({"a":1}{"b":2})"), GeoMalformedResponseError);
    EXPECT_THROW(Codec::parse(R"({"type":"Feature"} garbage)"), GeoMalformedResponseError);
}

TEST(CodecParse, TrailingWhitespaceAccepted) {
    auto j = Codec::parse("{\"a\":1}\r\n  ");
    EXPECT_EQ(j["a"], 1);
}

TEST(CodecParse, LargeUnsignedStaysIntegral) {
    auto j = Codec::parse(R"({"id":18446744073709551615})");
    EXPECT_TRUE(j["id"].is_number_unsigned());
    EXPECT_EQ(j["id"].get<uint64_t>(), 18446744073709551615ULL);
}

TEST(CodecParse, MalformedErrorIsGeoError) {
    try {
        (void)Codec::parse("[1,2");
        FAIL() << "expected GeoMalformedResponseError";
    } catch (const GeoError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MalformedResponse);
    }
}

// ---- Serialize tests ----

TEST(CodecSerialize, Compact) {
    nlohmann::json j = {{"type", "FeatureCollection"}, {"features", nlohmann::json::array()}};
    EXPECT_EQ(Codec::serialize(j), R"({"features":[],"type":"FeatureCollection"})");
}

TEST(CodecSerialize, ParseBack) {
    nlohmann::json j = {{"layer", "com.example.test"}, {"created", 42}};
    EXPECT_EQ(Codec::parse(Codec::serialize(j)), j);
}
