#include "geodata/registry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace geodata {

HandlerRegistry::HandlerRegistry(std::shared_ptr<spdlog::logger> logger)
    : base_(std::make_shared<const ResponseHandler>())
    , logger_(std::move(logger)) {
    handlers_[HandlerType::Json] = std::make_shared<const JsonHandler>();
    handlers_[HandlerType::GeoJson] = std::make_shared<const GeoJsonHandler>();
    handlers_[HandlerType::Record] = std::make_shared<const RecordHandler>();
}

void HandlerRegistry::set_handler(HandlerType type, HandlerPtr handler) {
    if (!handler) {
        throw std::invalid_argument("Handler for " + handler_type_to_string(type) + " is null");
    }
    if (type == HandlerType::Base) {
        logger_->warn("ignoring replacement of the base handler");
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[type] = std::move(handler);
}

HandlerPtr HandlerRegistry::handler(HandlerType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(type);
    if (it == handlers_.end()) return base_;
    return it->second;
}

} // namespace geodata
