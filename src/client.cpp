#include "geodata/client.hpp"
#include "geodata/error.hpp"
#include "geodata/log.hpp"
#include "geodata/normalizer.hpp"
#include "geodata/registry.hpp"
#include "geodata/version.hpp"
#include "geodata/worker_pool.hpp"
#include "geodata/transport/http_transport.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

namespace geodata {

namespace {

HandlerType handler_for(const AnyRecord& record) {
    return std::holds_alternative<Record>(record) ? HandlerType::Record : HandlerType::GeoJson;
}

HandlerType handler_for(const std::vector<AnyRecord>& records) {
    if (records.empty()) return HandlerType::GeoJson;
    return handler_for(records.front());
}

void require_handler(HandlerType requested, HandlerType supported, const std::string& operation) {
    if (requested != supported) {
        throw GeoUnsupportedOperationError(operation + " does not support the "
                                           + handler_type_to_string(requested) + " handler, only "
                                           + handler_type_to_string(supported));
    }
}

// The service answers a single-id lookup with a one-element list
Payload first_record(Payload payload) {
    if (auto* records = std::get_if<std::vector<Record>>(&payload)) {
        if (records->empty()) return std::monostate{};
        return Record(std::move(records->front()));
    }
    if (auto* doc = std::get_if<GeoDocument>(&payload)) {
        if (doc->is_feature_collection()) {
            auto features = doc->features();
            if (features.empty()) return std::monostate{};
            return GeoDocument(features.at(0));
        }
    }
    return payload;
}

std::shared_ptr<spdlog::logger> resolve_logger(const GeoClient::Options& opts) {
    return opts.logger ? opts.logger : default_logger();
}

} // anonymous namespace

struct GeoClient::Impl {
    Options opts;
    ClientContext context;
    HandlerRegistry registry;
    RequestBuilder builder;
    WorkerPool pool;
    Dispatcher dispatcher;

    Impl(Options o, std::shared_ptr<IHttpTransport> transport,
         std::shared_ptr<const IRequestSigner> signer)
        : opts(std::move(o))
        , context(opts.base_url, opts.mode, resolve_logger(opts))
        , registry(context.logger_ptr())
        , builder(context.base_url())
        , pool(opts.worker_threads)
        , dispatcher(context, registry, std::move(signer), std::move(transport), pool) {
        log().debug("geodata {} client for {} ({} workers, {})", LIBRARY_VERSION, context.base_url(),
                    opts.worker_threads, execution_mode_to_string(opts.mode));
    }

    ~Impl() {
        // In-flight deferred calls reference the dispatcher and context
        pool.shutdown();
    }

    spdlog::logger& log() { return context.logger(); }
};

GeoClient::GeoClient(Options opts) {
    HttpClientTransport::Options transport_opts;
    transport_opts.connect_timeout = opts.connect_timeout;
    transport_opts.read_timeout = opts.read_timeout;
    transport_opts.user_agent = std::string(USER_AGENT);

    auto transport = std::make_shared<HttpClientTransport>(opts.base_url, std::move(transport_opts));
    auto signer = std::make_shared<OAuthSigner>(
        OAuthSigner::Credentials{opts.consumer_key, opts.consumer_secret});
    impl_ = std::make_unique<Impl>(std::move(opts), std::move(transport), std::move(signer));
}

GeoClient::GeoClient(Options opts, std::shared_ptr<IHttpTransport> transport,
                     std::shared_ptr<const IRequestSigner> signer)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(transport), std::move(signer))) {}

GeoClient::~GeoClient() = default;

// ---------- Handlers / mode ----------

void GeoClient::set_handler(HandlerType type, HandlerPtr handler) {
    impl_->registry.set_handler(type, std::move(handler));
}

HandlerPtr GeoClient::handler(HandlerType type) const {
    return impl_->registry.handler(type);
}

void GeoClient::set_mode(ExecutionMode mode) noexcept {
    impl_->context.set_mode(mode);
}

ExecutionMode GeoClient::mode() const noexcept {
    return impl_->context.mode();
}

const RequestBuilder& GeoClient::request_builder() const {
    return impl_->builder;
}

// ---------- Records ----------

Reply GeoClient::retrieve(const AnyRecord& record) {
    auto normalized = RecordNormalizer::normalize(record, impl_->context.logger_ptr());
    auto request = impl_->builder.retrieve(normalized.layer, normalized.record_ids);
    return impl_->dispatcher.dispatch(std::move(request), handler_for(record), first_record);
}

Reply GeoClient::retrieve(const std::vector<AnyRecord>& records) {
    auto normalized = RecordNormalizer::normalize(records, impl_->context.logger_ptr());
    auto request = impl_->builder.retrieve(normalized.layer, normalized.record_ids);
    return impl_->dispatcher.dispatch(std::move(request), handler_for(records));
}

Reply GeoClient::retrieve(const std::string& layer, const std::string& record_ids, HandlerType type) {
    return impl_->dispatcher.dispatch(impl_->builder.retrieve(layer, record_ids), type);
}

Reply GeoClient::update(const AnyRecord& record) {
    auto normalized = RecordNormalizer::normalize(record, impl_->context.logger_ptr());
    impl_->log().info("updating {} in {}", normalized.record_ids.value_or("<new>"),
                      normalized.layer.value_or("<none>"));
    auto request = impl_->builder.update(normalized.layer, normalized.body);
    return impl_->dispatcher.dispatch(std::move(request), handler_for(record));
}

Reply GeoClient::update(const std::vector<AnyRecord>& records) {
    auto normalized = RecordNormalizer::normalize(records, impl_->context.logger_ptr());
    impl_->log().info("updating {} records in {}", records.size(),
                      normalized.layer.value_or("<none>"));
    auto request = impl_->builder.update(normalized.layer, normalized.body);
    return impl_->dispatcher.dispatch(std::move(request), handler_for(records));
}

Reply GeoClient::update(const std::string& layer, const GeoDocument& body, HandlerType type) {
    impl_->log().info("updating {}", layer);
    return impl_->dispatcher.dispatch(impl_->builder.update(layer, body), type);
}

Reply GeoClient::remove(const AnyRecord& record) {
    auto normalized = RecordNormalizer::normalize(record, impl_->context.logger_ptr());
    impl_->log().info("deleting {} from {}", normalized.record_ids.value_or("<none>"),
                      normalized.layer.value_or("<none>"));
    auto request = impl_->builder.remove(normalized.layer, normalized.record_ids);
    return impl_->dispatcher.dispatch(std::move(request), handler_for(record));
}

Reply GeoClient::remove(const std::string& layer, const std::string& record_id, HandlerType type) {
    impl_->log().info("deleting {} from {}", record_id, layer);
    return impl_->dispatcher.dispatch(impl_->builder.remove(layer, record_id), type);
}

// ---------- Queries ----------

Reply GeoClient::history(const HistoryQuery& query, HandlerType type) {
    require_handler(type, HandlerType::GeoJson, "history");
    return impl_->dispatcher.dispatch(impl_->builder.query(query), type);
}

Reply GeoClient::nearby(const NearbyQuery& query, HandlerType type) {
    return impl_->dispatcher.dispatch(impl_->builder.query(query), type);
}

// ---------- Places ----------

Reply GeoClient::reverse_geocode(double lat, double lon) {
    return impl_->dispatcher.dispatch(impl_->builder.reverse_geocode(lat, lon), HandlerType::GeoJson);
}

Reply GeoClient::density(Weekday day, int hour, double lat, double lon, HandlerType type) {
    return impl_->dispatcher.dispatch(impl_->builder.density(day, hour, lat, lon), type);
}

Reply GeoClient::contains(double lat, double lon, HandlerType type) {
    require_handler(type, HandlerType::Json, "contains");
    return impl_->dispatcher.dispatch(impl_->builder.contains(lat, lon), type);
}

Reply GeoClient::boundary(const std::string& feature_id, HandlerType type) {
    return impl_->dispatcher.dispatch(impl_->builder.boundary(feature_id), type);
}

Reply GeoClient::overlaps(const Envelope& envelope, int limit,
                          const std::optional<std::string>& feature_type, HandlerType type) {
    require_handler(type, HandlerType::Json, "overlaps");
    return impl_->dispatcher.dispatch(impl_->builder.overlaps(envelope, limit, feature_type), type);
}

} // namespace geodata
