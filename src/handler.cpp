#include "geodata/handler.hpp"
#include "geodata/codec.hpp"
#include "geodata/error.hpp"
#include "geodata/normalizer.hpp"
#include <nlohmann/json.hpp>
#include <exception>
#include <string>

namespace geodata {

std::string handler_type_to_string(HandlerType type) {
    switch (type) {
        case HandlerType::Json:    return "json";
        case HandlerType::GeoJson: return "geojson";
        case HandlerType::Record:  return "record";
        case HandlerType::Base:    return "base";
    }
    return "base";
}

// ---------- ResponseHandler ----------

Payload ResponseHandler::handle(const HttpResponse& response) const {
    check_status(response);
    return decode(response);
}

Payload ResponseHandler::decode(const HttpResponse& response) const {
    if (response.body.empty()) return std::monostate{};
    return Codec::parse(response.body);
}

void ResponseHandler::check_status(const HttpResponse& response) {
    if (response.status < 400) return;

    int code = response.status;
    std::string message = "HTTP " + std::to_string(response.status);

    // Service error bodies look like {"code": 404, "message": "..."}
    if (!response.body.empty()) {
        try {
            auto j = Codec::parse(response.body);
            if (j.is_object()) {
                auto c = j.find("code");
                if (c != j.end() && c->is_number_integer()) code = c->get<int>();
                auto m = j.find("message");
                if (m != j.end() && m->is_string()) message = m->get<std::string>();
            }
        } catch (const GeoMalformedResponseError&) {
            // Non-JSON error page: keep the status line
        }
    }

    std::rethrow_exception(make_api_error(code, message));
}

// ---------- JsonHandler ----------

Payload JsonHandler::decode(const HttpResponse& response) const {
    if (response.body.empty()) return std::monostate{};
    auto j = Codec::parse(response.body);
    if (!j.is_object() && !j.is_array()) {
        throw GeoMalformedResponseError("Expected a JSON object or array");
    }
    return j;
}

// ---------- GeoJsonHandler ----------

Payload GeoJsonHandler::decode(const HttpResponse& response) const {
    if (response.body.empty()) return std::monostate{};
    GeoDocument doc(Codec::parse(response.body));
    if (doc.kind() == DocumentKind::Unknown) {
        throw GeoMalformedResponseError("Response is not a GeoJSON object");
    }
    return doc;
}

// ---------- RecordHandler ----------

Payload RecordHandler::decode(const HttpResponse& response) const {
    if (response.body.empty()) return std::monostate{};
    GeoDocument doc(Codec::parse(response.body));
    auto records = RecordNormalizer::to_records(doc);
    if (doc.is_feature()) return records.front();
    return records;
}

} // namespace geodata
