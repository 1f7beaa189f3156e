#pragma once
#include "auth/signer.hpp"
#include "handler.hpp"
#include "registry.hpp"
#include "transport/transport.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <variant>

namespace spdlog {
    class logger;
}

namespace geodata {

enum class ExecutionMode { Synchronous, Deferred };

std::string execution_mode_to_string(ExecutionMode mode);

/// Lifecycle of one dispatched call.
enum class CallState { Idle, Building, Executing, Decoded, Failed };

std::string call_state_to_string(CallState state);

/// Configuration shared by every call a client makes. Built once by the
/// client and handed to the dispatcher.
///
/// The mode is read once at the start of each call. Changing it while another
/// thread is starting a call leaves that call's mode unspecified; callers must
/// not switch modes concurrently with calls that depend on it.
class ClientContext {
public:
    ClientContext(std::string base_url, ExecutionMode mode,
                  std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] ExecutionMode mode() const noexcept { return mode_.load(); }
    void set_mode(ExecutionMode mode) noexcept { mode_.store(mode); }

    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }
    [[nodiscard]] spdlog::logger& logger() const noexcept { return *logger_; }
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger_ptr() const noexcept { return logger_; }

private:
    std::string base_url_;
    std::atomic<ExecutionMode> mode_;
    std::shared_ptr<spdlog::logger> logger_;
};

/// Handle to a call running on the worker pool. Completes exactly once with a
/// payload or an error; every later read observes the same outcome. There is
/// no cancellation.
class Deferred {
public:
    explicit Deferred(std::shared_future<Payload> future);

    [[nodiscard]] bool ready() const;
    void wait() const;
    /// True when the call completed within timeout.
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout) const;

    /// Blocks until completion; rethrows the call's error.
    [[nodiscard]] const Payload& get() const;

    /// Blocks until completion; nullptr when the call succeeded.
    [[nodiscard]] std::exception_ptr error() const;

private:
    std::shared_future<Payload> future_;
};

/// A payload in synchronous mode, a Deferred handle in deferred mode.
using Reply = std::variant<Payload, Deferred>;

/// Payload of a reply, waiting for a deferred one. Rethrows its error.
[[nodiscard]] Payload resolve(const Reply& reply);

[[nodiscard]] bool is_deferred(const Reply& reply) noexcept;

/// Signs, sends and decodes requests, synchronously or on the worker pool.
class Dispatcher {
public:
    /// Post-processing applied to the decoded payload inside the same unit of
    /// work, so both modes produce the same result.
    using Finisher = std::function<Payload(Payload)>;

    Dispatcher(const ClientContext& context, const HandlerRegistry& registry,
               std::shared_ptr<const IRequestSigner> signer,
               std::shared_ptr<IHttpTransport> transport,
               WorkerPool& pool);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Decode the response with the handler registered for type.
    [[nodiscard]] Reply dispatch(HttpRequest request, HandlerType type, Finisher finish = nullptr);

    /// Sign, send and decode on the calling thread.
    /// Signing failures surface as GeoNotAuthorizedError and are not retried.
    [[nodiscard]] Payload execute(HttpRequest request, const ResponseHandler& handler,
                                  uint64_t call_id = 0) const;

private:
    const ClientContext& context_;
    const HandlerRegistry& registry_;
    std::shared_ptr<const IRequestSigner> signer_;
    std::shared_ptr<IHttpTransport> transport_;
    WorkerPool& pool_;
    mutable std::atomic<uint64_t> next_call_id_{1};
};

} // namespace geodata
