#pragma once
#include "query.hpp"
#include "types.hpp"
#include "transport/transport.hpp"
#include <optional>
#include <string>

namespace geodata {

enum class Weekday { Sunday, Monday, Tuesday, Wednesday, Thursday, Friday, Saturday };

/// Three-letter lower-case code used in density paths ("sun" ... "sat").
std::string weekday_code(Weekday day);

/// application/x-www-form-urlencoded encoding of a key or value.
[[nodiscard]] std::string form_encode(const std::string& value);

/// Percent-encoding for a single path segment; ',' and ':' are kept.
[[nodiscard]] std::string path_encode(const std::string& value);

/// Fixed six-decimal rendering, never scientific notation.
[[nodiscard]] std::string format_coordinate(double value);

/// Append params to url as ?k=v&k=v, skipping parameters without a value.
[[nodiscard]] std::string build_url(const std::string& url, const QueryParams& params);

/// Turns logical operations into method/URI/body triples rooted at base_url.
/// Missing layers or ids raise GeoInvalidRequestError.
class RequestBuilder {
public:
    explicit RequestBuilder(std::string base_url);

    [[nodiscard]] HttpRequest retrieve(const std::optional<std::string>& layer,
                                       const std::optional<std::string>& record_ids) const;
    [[nodiscard]] HttpRequest update(const std::optional<std::string>& layer,
                                     const GeoDocument& body) const;
    [[nodiscard]] HttpRequest remove(const std::optional<std::string>& layer,
                                     const std::optional<std::string>& record_id) const;

    [[nodiscard]] HttpRequest query(const Query& query) const;

    [[nodiscard]] HttpRequest reverse_geocode(double lat, double lon) const;
    /// hour in [0, 23] selects the hourly series, anything else the whole day.
    [[nodiscard]] HttpRequest density(Weekday day, int hour, double lat, double lon) const;
    [[nodiscard]] HttpRequest contains(double lat, double lon) const;
    [[nodiscard]] HttpRequest boundary(const std::string& feature_id) const;
    /// limit <= 0 and an empty feature_type are left out of the query string.
    [[nodiscard]] HttpRequest overlaps(const Envelope& envelope, int limit,
                                       const std::optional<std::string>& feature_type) const;

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

private:
    HttpRequest get(const std::string& path, const QueryParams& params = {}) const;

    std::string base_url_;
};

} // namespace geodata
