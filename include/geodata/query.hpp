#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace geodata {

/// Query-string parameters. Entries without a value are left out of the URL.
using QueryParams = std::map<std::string, std::optional<std::string>>;

/// A paginated search against one layer. The core only consumes path() and
/// params(); cursor and limit are plain query parameters.
class Query {
public:
    virtual ~Query() = default;

    [[nodiscard]] virtual std::string path() const = 0;
    [[nodiscard]] virtual QueryParams params() const;

    [[nodiscard]] const std::string& layer() const noexcept { return layer_; }
    void set_layer(std::string layer) { layer_ = std::move(layer); }

    /// Soft upper bound on the page size; the service may return fewer.
    [[nodiscard]] std::optional<int> limit() const noexcept { return limit_; }
    void set_limit(std::optional<int> limit) { limit_ = limit; }

    [[nodiscard]] const std::optional<std::string>& cursor() const noexcept { return cursor_; }
    void set_cursor(std::optional<std::string> cursor) { cursor_ = std::move(cursor); }

protected:
    Query(std::string layer, std::optional<int> limit, std::optional<std::string> cursor)
        : layer_(std::move(layer)), limit_(limit), cursor_(std::move(cursor)) {}

private:
    std::string layer_;
    std::optional<int> limit_;
    std::optional<std::string> cursor_;
};

class NearbyQuery : public Query {
public:
    [[nodiscard]] QueryParams params() const override;

    [[nodiscard]] const std::vector<std::string>& types() const noexcept { return types_; }
    void set_types(std::vector<std::string> types) { types_ = std::move(types); }

protected:
    NearbyQuery(std::string layer, std::vector<std::string> types,
                std::optional<int> limit, std::optional<std::string> cursor)
        : Query(std::move(layer), limit, std::move(cursor)), types_(std::move(types)) {}

private:
    std::vector<std::string> types_;
};

/// Records inside a geohash cell. The geohash is computed by the caller.
class GeohashNearbyQuery : public NearbyQuery {
public:
    GeohashNearbyQuery(std::string geohash, std::string layer,
                       std::vector<std::string> types = {},
                       std::optional<int> limit = std::nullopt,
                       std::optional<std::string> cursor = std::nullopt);

    [[nodiscard]] std::string path() const override;

    [[nodiscard]] const std::string& geohash() const noexcept { return geohash_; }
    void set_geohash(std::string geohash) { geohash_ = std::move(geohash); }

private:
    std::string geohash_;
};

/// Records within radius_km of a point.
class LatLonNearbyQuery : public NearbyQuery {
public:
    LatLonNearbyQuery(double latitude, double longitude, double radius_km, std::string layer,
                      std::vector<std::string> types = {},
                      std::optional<int> limit = std::nullopt,
                      std::optional<std::string> cursor = std::nullopt);

    [[nodiscard]] std::string path() const override;
    [[nodiscard]] QueryParams params() const override;

    [[nodiscard]] double latitude() const noexcept { return latitude_; }
    [[nodiscard]] double longitude() const noexcept { return longitude_; }
    [[nodiscard]] double radius() const noexcept { return radius_km_; }

private:
    double latitude_;
    double longitude_;
    double radius_km_;
};

/// Previous positions of one record, newest first.
class HistoryQuery : public Query {
public:
    HistoryQuery(std::string record_id, std::string layer,
                 std::optional<int> limit = std::nullopt,
                 std::optional<std::string> cursor = std::nullopt);

    [[nodiscard]] std::string path() const override;

    [[nodiscard]] const std::string& record_id() const noexcept { return record_id_; }

private:
    std::string record_id_;
};

} // namespace geodata
