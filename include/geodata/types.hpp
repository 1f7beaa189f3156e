#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace geodata {

// ---------- Record ----------

struct Record {
    std::optional<std::string> record_id;   // assigned by the caller or the service
    std::string layer;
    double latitude = 0.0;
    double longitude = 0.0;
    int64_t created = 0;                    // seconds since epoch
    std::string type = "object";
    nlohmann::json properties = nlohmann::json::object();

    bool operator==(const Record& o) const {
        return record_id == o.record_id && layer == o.layer && latitude == o.latitude
               && longitude == o.longitude && created == o.created && type == o.type
               && properties == o.properties;
    }
    bool operator!=(const Record& o) const { return !(*this == o); }
};

// ---------- GeoDocument ----------

enum class DocumentKind {
    Feature,
    FeatureCollection,
    Geometry,
    GeometryCollection,
    Unknown
};

/// A JSON document discriminated by its "type" member.
class GeoDocument {
public:
    GeoDocument() : json_(nlohmann::json::object()) {}
    explicit GeoDocument(nlohmann::json json) : json_(std::move(json)) {}

    [[nodiscard]] static GeoDocument feature_collection(nlohmann::json features = nlohmann::json::array());

    [[nodiscard]] DocumentKind kind() const;
    [[nodiscard]] bool is_feature() const { return kind() == DocumentKind::Feature; }
    [[nodiscard]] bool is_feature_collection() const { return kind() == DocumentKind::FeatureCollection; }
    [[nodiscard]] bool is_geometry_collection() const { return kind() == DocumentKind::GeometryCollection; }

    /// Members that are missing or of the wrong shape come back empty.
    [[nodiscard]] nlohmann::json features() const;
    [[nodiscard]] nlohmann::json geometries() const;
    [[nodiscard]] nlohmann::json properties() const;
    [[nodiscard]] std::optional<std::string> string_member(const std::string& key) const;

    [[nodiscard]] const nlohmann::json& json() const noexcept { return json_; }
    [[nodiscard]] nlohmann::json& json() noexcept { return json_; }
    [[nodiscard]] std::string dump() const { return json_.dump(); }

    bool operator==(const GeoDocument& o) const { return json_ == o.json_; }
    bool operator!=(const GeoDocument& o) const { return json_ != o.json_; }

private:
    nlohmann::json json_;
};

std::string document_kind_to_string(DocumentKind kind);
DocumentKind document_kind_from_string(const std::string& s);

/// Either representation a caller can hand to record operations.
using AnyRecord = std::variant<Record, GeoDocument>;

// ---------- Envelope ----------

/// Bounding box in degrees.
class Envelope {
public:
    Envelope(double west, double south, double east, double north)
        : west_(west), south_(south), east_(east), north_(north) {}

    [[nodiscard]] double west() const noexcept { return west_; }
    [[nodiscard]] double south() const noexcept { return south_; }
    [[nodiscard]] double east() const noexcept { return east_; }
    [[nodiscard]] double north() const noexcept { return north_; }

    /// "south,west,north,east" with fixed six-decimal coordinates.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Envelope& o) const {
        return west_ == o.west_ && south_ == o.south_ && east_ == o.east_ && north_ == o.north_;
    }

private:
    const double west_;
    const double south_;
    const double east_;
    const double north_;
};

// ---------- Decoded results ----------

/// What a decoder produces: nothing, one record, many records, a document,
/// or a raw JSON array/object.
using Payload = std::variant<std::monostate, Record, std::vector<Record>, GeoDocument, nlohmann::json>;

// ---------- JSON serialization ----------

/// Records travel as GeoJSON Features with top-level id/layer/created.
void to_json(nlohmann::json& j, const Record& r);
void from_json(const nlohmann::json& j, Record& r);

} // namespace geodata
