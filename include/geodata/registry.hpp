#pragma once
#include "handler.hpp"
#include "log.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>

namespace geodata {

/// Decoders by HandlerType, owned by one client. Safe for concurrent use;
/// handlers themselves are shared read-only across in-flight calls.
class HandlerRegistry {
public:
    explicit HandlerRegistry(std::shared_ptr<spdlog::logger> logger = default_logger());

    /// Replace the decoder for Json, GeoJson or Record. The Base handler is
    /// fixed; requests to replace it are ignored.
    void set_handler(HandlerType type, HandlerPtr handler);

    /// Registered decoder for type, or the base handler.
    [[nodiscard]] HandlerPtr handler(HandlerType type) const;

    [[nodiscard]] const ResponseHandler& base() const noexcept { return *base_; }

private:
    mutable std::mutex mutex_;
    std::unordered_map<HandlerType, HandlerPtr> handlers_;
    const HandlerPtr base_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace geodata
