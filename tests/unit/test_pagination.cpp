#include <gtest/gtest.h>
#include "geodata/pagination.hpp"

using namespace geodata;

TEST(NextCursor, FromDocument) {
    GeoDocument page(nlohmann::json{{"type", "FeatureCollection"}, {"features", nlohmann::json::array()},
                                    {"next_cursor", "abc"}});
    EXPECT_EQ(next_cursor(page), "abc");
}

TEST(NextCursor, FromJsonObject) {
    Payload page = nlohmann::json{{"next_cursor", "xyz"}, {"items", {1, 2}}};
    EXPECT_EQ(next_cursor(page), "xyz");
}

TEST(NextCursor, EndOfSequence) {
    EXPECT_FALSE(next_cursor(GeoDocument::feature_collection()).has_value());
    EXPECT_FALSE(next_cursor(nlohmann::json{{"next_cursor", nullptr}}).has_value());
    EXPECT_FALSE(next_cursor(nlohmann::json{{"next_cursor", ""}}).has_value());
    EXPECT_FALSE(next_cursor(nlohmann::json::array({1, 2})).has_value());
    EXPECT_FALSE(next_cursor(std::monostate{}).has_value());
}

TEST(NextCursor, RecordsCarryNoCursor) {
    EXPECT_FALSE(next_cursor(std::vector<Record>(2)).has_value());
    EXPECT_FALSE(next_cursor(Record{}).has_value());
}

TEST(PageSize, CountsItems) {
    auto features = nlohmann::json::array({nlohmann::json::object(), nlohmann::json::object()});
    EXPECT_EQ(page_size(GeoDocument::feature_collection(features)), 2u);
    EXPECT_EQ(page_size(GeoDocument(nlohmann::json{{"type", "GeometryCollection"},
                                                   {"geometries", features}})), 2u);
    EXPECT_EQ(page_size(GeoDocument(nlohmann::json{{"type", "Feature"}})), 1u);
    EXPECT_EQ(page_size(std::vector<Record>(3)), 3u);
    EXPECT_EQ(page_size(Record{}), 1u);
    EXPECT_EQ(page_size(nlohmann::json::array({1, 2, 3, 4})), 4u);
    EXPECT_EQ(page_size(std::monostate{}), 0u);
}
