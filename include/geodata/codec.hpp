#pragma once
#include "error.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace geodata {

class Codec {
public:
    /// Parse raw JSON bytes into a document.
    /// Throws GeoMalformedResponseError on invalid JSON.
    [[nodiscard]] static nlohmann::json parse(std::string_view raw);

    /// Serialize a document to its compact wire form.
    [[nodiscard]] static std::string serialize(const nlohmann::json& j);
};

} // namespace geodata
