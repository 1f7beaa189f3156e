#include "geodata/query.hpp"
#include "geodata/request_builder.hpp"
#include <string>

namespace geodata {

QueryParams Query::params() const {
    QueryParams params;
    if (limit_) params["limit"] = std::to_string(*limit_);
    if (cursor_) params["cursor"] = *cursor_;
    return params;
}

QueryParams NearbyQuery::params() const {
    QueryParams params = Query::params();
    if (!types_.empty()) {
        std::string joined;
        for (const auto& t : types_) {
            if (!joined.empty()) joined += ',';
            joined += t;
        }
        params["types"] = joined;
    }
    return params;
}

// ---------- GeohashNearbyQuery ----------

GeohashNearbyQuery::GeohashNearbyQuery(std::string geohash, std::string layer,
                                       std::vector<std::string> types,
                                       std::optional<int> limit,
                                       std::optional<std::string> cursor)
    : NearbyQuery(std::move(layer), std::move(types), limit, std::move(cursor))
    , geohash_(std::move(geohash)) {}

std::string GeohashNearbyQuery::path() const {
    return "/records/" + path_encode(layer()) + "/nearby/" + path_encode(geohash_) + ".json";
}

// ---------- LatLonNearbyQuery ----------

LatLonNearbyQuery::LatLonNearbyQuery(double latitude, double longitude, double radius_km,
                                     std::string layer, std::vector<std::string> types,
                                     std::optional<int> limit,
                                     std::optional<std::string> cursor)
    : NearbyQuery(std::move(layer), std::move(types), limit, std::move(cursor))
    , latitude_(latitude)
    , longitude_(longitude)
    , radius_km_(radius_km) {}

std::string LatLonNearbyQuery::path() const {
    return "/records/" + path_encode(layer()) + "/nearby/" + format_coordinate(latitude_) + ","
           + format_coordinate(longitude_) + ".json";
}

QueryParams LatLonNearbyQuery::params() const {
    QueryParams params = NearbyQuery::params();
    if (radius_km_ > 0.0) params["radius"] = format_coordinate(radius_km_);
    return params;
}

// ---------- HistoryQuery ----------

HistoryQuery::HistoryQuery(std::string record_id, std::string layer,
                           std::optional<int> limit, std::optional<std::string> cursor)
    : Query(std::move(layer), limit, std::move(cursor))
    , record_id_(std::move(record_id)) {}

std::string HistoryQuery::path() const {
    return "/records/" + path_encode(layer()) + "/" + path_encode(record_id_) + "/history.json";
}

} // namespace geodata
