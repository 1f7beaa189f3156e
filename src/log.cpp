#include "geodata/log.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>

namespace geodata {

std::shared_ptr<spdlog::logger> default_logger() {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    const std::string name(LOGGER_NAME);
    if (auto existing = spdlog::get(name)) return existing;
    return spdlog::stdout_color_mt(name);
}

} // namespace geodata
