#include "geodata/normalizer.hpp"
#include "geodata/error.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <type_traits>

namespace geodata {

namespace {

std::optional<std::string> string_field(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (it->is_string()) {
        auto s = it->get<std::string>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    if (it->is_number_integer()) return it->dump();
    return std::nullopt;
}

void append_id(std::optional<std::string>& joined, const std::optional<std::string>& id) {
    if (!id) return;
    if (joined) {
        *joined += ",";
        *joined += *id;
    } else {
        joined = id;
    }
}

} // anonymous namespace

GeoDocument RecordNormalizer::to_document(const AnyRecord& record) {
    return std::visit([](const auto& r) -> GeoDocument {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, Record>) {
            nlohmann::json j = r;
            return GeoDocument(std::move(j));
        } else {
            return r;
        }
    }, record);
}

GeoDocument RecordNormalizer::to_document(const std::vector<AnyRecord>& records,
                                          const std::shared_ptr<spdlog::logger>& log) {
    nlohmann::json features = nlohmann::json::array();
    for (const auto& record : records) {
        GeoDocument doc = to_document(record);
        switch (doc.kind()) {
            case DocumentKind::Feature:
                features.push_back(doc.json());
                break;
            case DocumentKind::FeatureCollection:
                for (const auto& f : doc.features()) features.push_back(f);
                break;
            default:
                log->debug("skipping {} document in record list",
                           document_kind_to_string(doc.kind()));
                break;
        }
    }
    return GeoDocument::feature_collection(std::move(features));
}

GeoDocument RecordNormalizer::update_body(const AnyRecord& record) {
    GeoDocument doc = to_document(record);
    if (std::holds_alternative<GeoDocument>(record) && doc.is_feature()) {
        return GeoDocument::feature_collection(nlohmann::json::array({doc.json()}));
    }
    return doc;
}

GeoDocument RecordNormalizer::update_body(const std::vector<AnyRecord>& records,
                                          const std::shared_ptr<spdlog::logger>& log) {
    return to_document(records, log);
}

std::optional<std::string> RecordNormalizer::layer_of(const AnyRecord& record,
                                                       const std::shared_ptr<spdlog::logger>& log) {
    if (const auto* r = std::get_if<Record>(&record)) {
        if (r->layer.empty()) return std::nullopt;
        return r->layer;
    }

    const auto& doc = std::get<GeoDocument>(record);
    std::optional<std::string> layer;
    switch (doc.kind()) {
        case DocumentKind::Feature:
            layer = string_field(doc.json(), "layer");
            break;
        case DocumentKind::FeatureCollection: {
            auto features = doc.features();
            if (!features.empty()) layer = string_field(features.at(0), "layer");
            break;
        }
        default:
            break;
    }
    if (!layer) log->debug("unable to locate layer for {}", doc.dump());
    return layer;
}

std::optional<std::string> RecordNormalizer::layer_of(const std::vector<AnyRecord>& records,
                                                       const std::shared_ptr<spdlog::logger>& log) {
    if (records.empty()) return std::nullopt;
    return layer_of(records.front(), log);
}

std::optional<std::string> RecordNormalizer::record_ids_of(const AnyRecord& record,
                                                            const std::shared_ptr<spdlog::logger>& log) {
    if (const auto* r = std::get_if<Record>(&record)) {
        if (!r->record_id || r->record_id->empty()) return std::nullopt;
        return r->record_id;
    }

    const auto& doc = std::get<GeoDocument>(record);
    std::optional<std::string> ids;
    switch (doc.kind()) {
        case DocumentKind::Feature:
            ids = string_field(doc.json(), "id");
            break;
        case DocumentKind::FeatureCollection:
            for (const auto& feature : doc.features()) {
                append_id(ids, string_field(feature, "id"));
            }
            break;
        default:
            break;
    }
    if (!ids) log->debug("unable to locate record id for {}", doc.dump());
    return ids;
}

std::optional<std::string> RecordNormalizer::record_ids_of(const std::vector<AnyRecord>& records,
                                                            const std::shared_ptr<spdlog::logger>& log) {
    std::optional<std::string> ids;
    for (const auto& record : records) {
        append_id(ids, record_ids_of(record, log));
    }
    return ids;
}

NormalizedRecords RecordNormalizer::normalize(const AnyRecord& record, const std::shared_ptr<spdlog::logger>& log) {
    return NormalizedRecords{layer_of(record, log), record_ids_of(record, log), update_body(record)};
}

NormalizedRecords RecordNormalizer::normalize(const std::vector<AnyRecord>& records,
                                              const std::shared_ptr<spdlog::logger>& log) {
    return NormalizedRecords{layer_of(records, log), record_ids_of(records, log),
                             update_body(records, log)};
}

std::vector<Record> RecordNormalizer::to_records(const GeoDocument& document) {
    std::vector<Record> records;
    try {
        switch (document.kind()) {
            case DocumentKind::Feature:
                records.push_back(document.json().get<Record>());
                break;
            case DocumentKind::FeatureCollection:
                for (const auto& feature : document.features()) {
                    records.push_back(feature.get<Record>());
                }
                break;
            default:
                throw GeoMalformedResponseError("Expected a Feature or FeatureCollection, got "
                                                + document_kind_to_string(document.kind()));
        }
    } catch (const nlohmann::json::exception& e) {
        throw GeoMalformedResponseError(std::string("Invalid record: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw GeoMalformedResponseError(std::string("Invalid record: ") + e.what());
    }
    return records;
}

} // namespace geodata
