#pragma once
#include <memory>
#include <string_view>

namespace spdlog {
    class logger;
}

namespace geodata {

constexpr std::string_view LOGGER_NAME = "geodata";

/// The shared "geodata" logger, registered with spdlog on first use.
[[nodiscard]] std::shared_ptr<spdlog::logger> default_logger();

} // namespace geodata
