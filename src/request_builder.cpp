#include "geodata/request_builder.hpp"
#include "geodata/codec.hpp"
#include "geodata/error.hpp"
#include <cctype>
#include <cstdio>
#include <string>

namespace geodata {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

bool is_unreserved(unsigned char ch) {
    return std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '~';
}

void append_escaped(std::string& out, unsigned char ch) {
    out.push_back('%');
    out.push_back(kHexDigits[(ch >> 4) & 0x0F]);
    out.push_back(kHexDigits[ch & 0x0F]);
}

const std::string& require(const std::string& value, const char* what) {
    if (value.empty()) {
        throw GeoInvalidRequestError(std::string("Cannot build request without a ") + what);
    }
    return value;
}

const std::string& require(const std::optional<std::string>& value, const char* what) {
    if (!value) {
        throw GeoInvalidRequestError(std::string("Cannot build request without a ") + what);
    }
    return require(*value, what);
}

} // anonymous namespace

std::string weekday_code(Weekday day) {
    switch (day) {
        case Weekday::Sunday:    return "sun";
        case Weekday::Monday:    return "mon";
        case Weekday::Tuesday:   return "tue";
        case Weekday::Wednesday: return "wed";
        case Weekday::Thursday:  return "thu";
        case Weekday::Friday:    return "fri";
        case Weekday::Saturday:  return "sat";
    }
    return "sun";
}

std::string form_encode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size() * 2);
    for (unsigned char ch : value) {
        if (std::isalnum(ch) != 0 || ch == '-' || ch == '_' || ch == '.' || ch == '*') {
            encoded.push_back(static_cast<char>(ch));
        } else if (ch == ' ') {
            encoded.push_back('+');
        } else {
            append_escaped(encoded, ch);
        }
    }
    return encoded;
}

std::string path_encode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size() * 2);
    for (unsigned char ch : value) {
        if (is_unreserved(ch) || ch == ',' || ch == ':') {
            encoded.push_back(static_cast<char>(ch));
        } else {
            append_escaped(encoded, ch);
        }
    }
    return encoded;
}

std::string format_coordinate(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", value);
    return buf;
}

std::string build_url(const std::string& url, const QueryParams& params) {
    std::string result = url;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!value) continue;
        result += first ? '?' : '&';
        result += form_encode(key);
        result += '=';
        result += form_encode(*value);
        first = false;
    }
    return result;
}

// ---------- RequestBuilder ----------

RequestBuilder::RequestBuilder(std::string base_url)
    : base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

HttpRequest RequestBuilder::get(const std::string& path, const QueryParams& params) const {
    HttpRequest req;
    req.method = HttpMethod::Get;
    req.uri = build_url(base_url_ + path, params);
    return req;
}

HttpRequest RequestBuilder::retrieve(const std::optional<std::string>& layer,
                                     const std::optional<std::string>& record_ids) const {
    const auto& l = require(layer, "layer");
    const auto& ids = require(record_ids, "record id");
    return get("/records/" + path_encode(l) + "/" + path_encode(ids) + ".json");
}

HttpRequest RequestBuilder::update(const std::optional<std::string>& layer,
                                   const GeoDocument& body) const {
    const auto& l = require(layer, "layer");
    HttpRequest req;
    req.method = HttpMethod::Post;
    req.uri = base_url_ + "/records/" + path_encode(l) + ".json";
    req.body = Codec::serialize(body.json());
    req.content_type = "application/json";
    return req;
}

HttpRequest RequestBuilder::remove(const std::optional<std::string>& layer,
                                   const std::optional<std::string>& record_id) const {
    const auto& l = require(layer, "layer");
    const auto& id = require(record_id, "record id");
    HttpRequest req;
    req.method = HttpMethod::Delete;
    req.uri = base_url_ + "/records/" + path_encode(l) + "/" + path_encode(id) + ".json";
    return req;
}

HttpRequest RequestBuilder::query(const Query& query) const {
    require(query.layer(), "layer");
    return get(query.path(), query.params());
}

HttpRequest RequestBuilder::reverse_geocode(double lat, double lon) const {
    return get("/nearby/address/" + format_coordinate(lat) + "," + format_coordinate(lon) + ".json");
}

HttpRequest RequestBuilder::density(Weekday day, int hour, double lat, double lon) const {
    std::string path = "/density/" + weekday_code(day) + "/";
    if (hour >= 0 && hour <= 23) {
        path += std::to_string(hour) + "/";
    }
    path += format_coordinate(lat) + "," + format_coordinate(lon) + ".json";
    return get(path);
}

HttpRequest RequestBuilder::contains(double lat, double lon) const {
    return get("/contains/" + format_coordinate(lat) + "," + format_coordinate(lon) + ".json");
}

HttpRequest RequestBuilder::boundary(const std::string& feature_id) const {
    const auto& id = require(feature_id, "feature id");
    return get("/boundary/" + path_encode(id) + ".json");
}

HttpRequest RequestBuilder::overlaps(const Envelope& envelope, int limit,
                                     const std::optional<std::string>& feature_type) const {
    QueryParams params;
    if (limit > 0) params["limit"] = std::to_string(limit);
    if (feature_type && !feature_type->empty()) params["type"] = *feature_type;
    return get("/overlaps/" + envelope.to_string() + ".json", params);
}

} // namespace geodata
