#pragma once
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace geodata {

/// The "next_cursor" member of a document or JSON object payload.
/// std::nullopt marks the last page.
[[nodiscard]] std::optional<std::string> next_cursor(const Payload& payload);

/// Number of items on a page: features, geometries, records or array elements.
[[nodiscard]] std::size_t page_size(const Payload& payload);

} // namespace geodata
