#pragma once
#include "dispatcher.hpp"
#include "handler.hpp"
#include "query.hpp"
#include "request_builder.hpp"
#include "types.hpp"
#include "version.hpp"
#include "auth/signer.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog {
    class logger;
}

namespace geodata {

class GeoClient {
public:
    struct Options {
        std::string base_url{DEFAULT_BASE_URL};
        std::string consumer_key;
        std::string consumer_secret;
        int worker_threads = 4;
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds read_timeout{60};
        ExecutionMode mode = ExecutionMode::Synchronous;
        /// Falls back to the shared "geodata" logger.
        std::shared_ptr<spdlog::logger> logger;
    };

    /// Talks to opts.base_url over HTTP, signing with the consumer key/secret.
    explicit GeoClient(Options opts);

    /// Uses the given transport and signer instead of the HTTP/OAuth defaults.
    GeoClient(Options opts, std::shared_ptr<IHttpTransport> transport,
              std::shared_ptr<const IRequestSigner> signer);

    ~GeoClient();

    GeoClient(const GeoClient&) = delete;
    GeoClient& operator=(const GeoClient&) = delete;

    // ---- Handlers ----
    void set_handler(HandlerType type, HandlerPtr handler);
    [[nodiscard]] HandlerPtr handler(HandlerType type) const;

    // ---- Execution mode ----
    void set_mode(ExecutionMode mode) noexcept;
    [[nodiscard]] ExecutionMode mode() const noexcept;

    // ---- Records ----
    /// Single record; the service's one-element list is unwrapped.
    [[nodiscard]] Reply retrieve(const AnyRecord& record);
    [[nodiscard]] Reply retrieve(const std::vector<AnyRecord>& records);
    [[nodiscard]] Reply retrieve(const std::string& layer, const std::string& record_ids,
                                 HandlerType type);

    [[nodiscard]] Reply update(const AnyRecord& record);
    [[nodiscard]] Reply update(const std::vector<AnyRecord>& records);
    [[nodiscard]] Reply update(const std::string& layer, const GeoDocument& body, HandlerType type);

    [[nodiscard]] Reply remove(const AnyRecord& record);
    [[nodiscard]] Reply remove(const std::string& layer, const std::string& record_id,
                               HandlerType type);

    // ---- Queries ----
    /// Only the GeoJson handler is supported.
    [[nodiscard]] Reply history(const HistoryQuery& query, HandlerType type = HandlerType::GeoJson);
    [[nodiscard]] Reply nearby(const NearbyQuery& query, HandlerType type = HandlerType::GeoJson);

    // ---- Places ----
    [[nodiscard]] Reply reverse_geocode(double lat, double lon);
    [[nodiscard]] Reply density(Weekday day, int hour, double lat, double lon,
                                HandlerType type = HandlerType::GeoJson);
    /// Only the Json handler is supported.
    [[nodiscard]] Reply contains(double lat, double lon, HandlerType type = HandlerType::Json);
    [[nodiscard]] Reply boundary(const std::string& feature_id, HandlerType type = HandlerType::GeoJson);
    /// Only the Json handler is supported. limit is a soft cap.
    [[nodiscard]] Reply overlaps(const Envelope& envelope, int limit,
                                 const std::optional<std::string>& feature_type = std::nullopt,
                                 HandlerType type = HandlerType::Json);

    [[nodiscard]] const RequestBuilder& request_builder() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace geodata
