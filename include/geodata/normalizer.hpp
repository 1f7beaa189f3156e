#pragma once
#include "log.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geodata {

/// Canonical form of one or more records: where they live, which ids they
/// name, and the document sent as a request body.
struct NormalizedRecords {
    std::optional<std::string> layer;
    std::optional<std::string> record_ids;   // comma-joined
    GeoDocument body;
};

/// Converts records and documents into the wire representation.
///
/// Layer and id extraction is best effort: a document that does not have the
/// expected shape yields std::nullopt instead of an exception, and the request
/// builder rejects the missing value before anything is sent. Misses are
/// logged at debug level to the given logger.
class RecordNormalizer {
public:
    /// Record -> Feature. Documents are returned unchanged.
    [[nodiscard]] static GeoDocument to_document(const AnyRecord& record);

    /// FeatureCollection of every element. Nested collections contribute
    /// their features.
    [[nodiscard]] static GeoDocument to_document(const std::vector<AnyRecord>& records,
                                                 const std::shared_ptr<spdlog::logger>& log = default_logger());

    /// Body for a single write: a Record is sent as a bare Feature, a Feature
    /// document is wrapped in a one-element FeatureCollection, anything else
    /// is sent as is.
    [[nodiscard]] static GeoDocument update_body(const AnyRecord& record);

    /// Body for a batch write, always a FeatureCollection.
    [[nodiscard]] static GeoDocument update_body(const std::vector<AnyRecord>& records,
                                                 const std::shared_ptr<spdlog::logger>& log = default_logger());

    [[nodiscard]] static std::optional<std::string> layer_of(const AnyRecord& record,
                                                              const std::shared_ptr<spdlog::logger>& log = default_logger());
    /// Layer of the first element.
    [[nodiscard]] static std::optional<std::string> layer_of(const std::vector<AnyRecord>& records,
                                                              const std::shared_ptr<spdlog::logger>& log = default_logger());

    /// Every id found, in order, joined with ','. Elements without an id are skipped.
    [[nodiscard]] static std::optional<std::string> record_ids_of(const AnyRecord& record,
                                                                   const std::shared_ptr<spdlog::logger>& log = default_logger());
    [[nodiscard]] static std::optional<std::string> record_ids_of(const std::vector<AnyRecord>& records,
                                                                   const std::shared_ptr<spdlog::logger>& log = default_logger());

    [[nodiscard]] static NormalizedRecords normalize(const AnyRecord& record,
                                                 const std::shared_ptr<spdlog::logger>& log = default_logger());
    [[nodiscard]] static NormalizedRecords normalize(const std::vector<AnyRecord>& records,
                                                 const std::shared_ptr<spdlog::logger>& log = default_logger());

    /// Reverse of to_document for Features and FeatureCollections.
    /// Throws GeoMalformedResponseError for any other document.
    [[nodiscard]] static std::vector<Record> to_records(const GeoDocument& document);
};

} // namespace geodata
