#include "geodata/dispatcher.hpp"
#include "geodata/error.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace geodata {

std::string execution_mode_to_string(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Synchronous: return "synchronous";
        case ExecutionMode::Deferred:    return "deferred";
    }
    return "synchronous";
}

std::string call_state_to_string(CallState state) {
    switch (state) {
        case CallState::Idle:      return "idle";
        case CallState::Building:  return "building";
        case CallState::Executing: return "executing";
        case CallState::Decoded:   return "decoded";
        case CallState::Failed:    return "failed";
    }
    return "idle";
}

// ---------- ClientContext ----------

ClientContext::ClientContext(std::string base_url, ExecutionMode mode,
                             std::shared_ptr<spdlog::logger> logger)
    : base_url_(std::move(base_url))
    , mode_(mode)
    , logger_(std::move(logger)) {}

// ---------- Deferred ----------

Deferred::Deferred(std::shared_future<Payload> future)
    : future_(std::move(future)) {}

bool Deferred::ready() const {
    return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void Deferred::wait() const {
    future_.wait();
}

bool Deferred::wait_for(std::chrono::milliseconds timeout) const {
    return future_.wait_for(timeout) == std::future_status::ready;
}

const Payload& Deferred::get() const {
    return future_.get();
}

std::exception_ptr Deferred::error() const {
    try {
        future_.get();
    } catch (...) {
        return std::current_exception();
    }
    return nullptr;
}

Payload resolve(const Reply& reply) {
    if (const auto* deferred = std::get_if<Deferred>(&reply)) {
        return deferred->get();
    }
    return std::get<Payload>(reply);
}

bool is_deferred(const Reply& reply) noexcept {
    return std::holds_alternative<Deferred>(reply);
}

// ---------- Dispatcher ----------

Dispatcher::Dispatcher(const ClientContext& context, const HandlerRegistry& registry,
                       std::shared_ptr<const IRequestSigner> signer,
                       std::shared_ptr<IHttpTransport> transport,
                       WorkerPool& pool)
    : context_(context)
    , registry_(registry)
    , signer_(std::move(signer))
    , transport_(std::move(transport))
    , pool_(pool) {}

Reply Dispatcher::dispatch(HttpRequest request, HandlerType type, Finisher finish) {
    const uint64_t call_id = next_call_id_++;
    const ExecutionMode mode = context_.mode();
    HandlerPtr handler = registry_.handler(type);

    context_.logger().debug("call {}: {} {} ({} handler, {})", call_id,
                            http_method_to_string(request.method), request.uri,
                            handler_type_to_string(type), execution_mode_to_string(mode));

    if (mode == ExecutionMode::Synchronous) {
        Payload payload = execute(std::move(request), *handler, call_id);
        if (finish) return finish(std::move(payload));
        return payload;
    }

    auto promise = std::make_shared<std::promise<Payload>>();
    std::shared_future<Payload> future = promise->get_future().share();

    pool_.submit([this, promise, handler, call_id,
                  request = std::move(request), finish = std::move(finish)]() {
        try {
            Payload payload = execute(request, *handler, call_id);
            promise->set_value(finish ? finish(std::move(payload)) : std::move(payload));
        } catch (...) {
            // Delivered to whoever holds the Deferred
            promise->set_exception(std::current_exception());
        }
    });

    return Deferred(std::move(future));
}

Payload Dispatcher::execute(HttpRequest request, const ResponseHandler& handler,
                            uint64_t call_id) const {
    if (call_id == 0) call_id = next_call_id_++;
    auto& log = context_.logger();

    if (signer_) {
        try {
            signer_->sign(request);
        } catch (const GeoSigningError& e) {
            log.warn("call {}: {}: signing failed: {}", call_id,
                     call_state_to_string(CallState::Failed), e.what());
            throw GeoNotAuthorizedError(std::string("Unable to sign request: ") + e.what());
        }
    }

    log.info("call {}: sending {} {}", call_id, http_method_to_string(request.method), request.uri);
    log.debug("call {}: {}", call_id, call_state_to_string(CallState::Executing));

    HttpResponse response;
    try {
        response = transport_->execute(request);
    } catch (const GeoTransportError& e) {
        log.warn("call {}: {}: transport failure: {}", call_id,
                 call_state_to_string(CallState::Failed), e.what());
        throw;
    }
    log.debug("call {}: status {} ({} bytes)", call_id, response.status, response.body.size());

    try {
        Payload payload = handler.handle(response);
        log.info("call {}: {} (status {})", call_id, call_state_to_string(CallState::Decoded),
                 response.status);
        return payload;
    } catch (const GeoError& e) {
        log.warn("call {}: {}: {} ({})", call_id, call_state_to_string(CallState::Failed), e.what(),
                 error_kind_to_string(e.kind()));
        throw;
    }
}

} // namespace geodata
