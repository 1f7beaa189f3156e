#include "geodata/types.hpp"
#include "geodata/request_builder.hpp"
#include <stdexcept>

namespace geodata {

// ---------- GeoDocument ----------

GeoDocument GeoDocument::feature_collection(nlohmann::json features) {
    return GeoDocument(nlohmann::json{{"type", "FeatureCollection"}, {"features", std::move(features)}});
}

DocumentKind GeoDocument::kind() const {
    if (!json_.is_object()) return DocumentKind::Unknown;
    auto it = json_.find("type");
    if (it == json_.end() || !it->is_string()) return DocumentKind::Unknown;
    return document_kind_from_string(it->get<std::string>());
}

nlohmann::json GeoDocument::features() const {
    if (json_.is_object() && json_.contains("features") && json_.at("features").is_array()) {
        return json_.at("features");
    }
    return nlohmann::json::array();
}

nlohmann::json GeoDocument::geometries() const {
    if (json_.is_object() && json_.contains("geometries") && json_.at("geometries").is_array()) {
        return json_.at("geometries");
    }
    return nlohmann::json::array();
}

nlohmann::json GeoDocument::properties() const {
    if (json_.is_object() && json_.contains("properties") && json_.at("properties").is_object()) {
        return json_.at("properties");
    }
    return nlohmann::json::object();
}

std::optional<std::string> GeoDocument::string_member(const std::string& key) const {
    if (!json_.is_object()) return std::nullopt;
    auto it = json_.find(key);
    if (it == json_.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::string document_kind_to_string(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::Feature:            return "Feature";
        case DocumentKind::FeatureCollection:  return "FeatureCollection";
        case DocumentKind::GeometryCollection: return "GeometryCollection";
        case DocumentKind::Geometry:           return "Geometry";
        case DocumentKind::Unknown:            return "Unknown";
    }
    return "Unknown";
}

DocumentKind document_kind_from_string(const std::string& s) {
    if (s == "Feature") return DocumentKind::Feature;
    if (s == "FeatureCollection") return DocumentKind::FeatureCollection;
    if (s == "GeometryCollection") return DocumentKind::GeometryCollection;
    // Any GeoJSON geometry type
    if (s == "Point" || s == "MultiPoint" || s == "LineString" || s == "MultiLineString"
        || s == "Polygon" || s == "MultiPolygon") {
        return DocumentKind::Geometry;
    }
    return DocumentKind::Unknown;
}

// ---------- Envelope ----------

std::string Envelope::to_string() const {
    return format_coordinate(south_) + "," + format_coordinate(west_) + ","
           + format_coordinate(north_) + "," + format_coordinate(east_);
}

// ---------- Record ----------

void to_json(nlohmann::json& j, const Record& r) {
    nlohmann::json properties = r.properties.is_object() ? r.properties : nlohmann::json::object();
    properties["type"] = r.type;

    j = {
        {"type", "Feature"},
        {"layer", r.layer},
        {"created", r.created},
        {"geometry", {{"type", "Point"}, {"coordinates", {r.longitude, r.latitude}}}},
        {"properties", std::move(properties)}
    };
    if (r.record_id) j["id"] = *r.record_id;
}

void from_json(const nlohmann::json& j, Record& r) {
    if (j.value("type", "") != "Feature") {
        throw std::invalid_argument("record must be a GeoJSON Feature");
    }
    if (j.contains("id") && !j.at("id").is_null()) {
        const auto& id = j.at("id");
        if (id.is_number_integer()) {
            // Matches how record ids are read off documents
            r.record_id = id.dump();
        } else if (id.is_string()) {
            r.record_id = id.get<std::string>();
        } else {
            throw std::invalid_argument("record id must be a string or an integer");
        }
    }
    r.layer = j.value("layer", "");
    if (j.contains("created") && !j.at("created").is_null()) {
        r.created = j.at("created").get<int64_t>();
    }

    const auto& coordinates = j.at("geometry").at("coordinates");
    r.longitude = coordinates.at(0).get<double>();
    r.latitude = coordinates.at(1).get<double>();

    r.properties = nlohmann::json::object();
    if (j.contains("properties") && j.at("properties").is_object()) {
        r.properties = j.at("properties");
    }
    auto type_it = r.properties.find("type");
    if (type_it != r.properties.end() && type_it->is_string()) {
        r.type = type_it->get<std::string>();
        r.properties.erase(type_it);
    }
}

} // namespace geodata
