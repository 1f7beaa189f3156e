#include "geodata/pagination.hpp"
#include <type_traits>

namespace geodata {

namespace {

std::optional<std::string> cursor_member(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find("next_cursor");
    if (it == j.end() || !it->is_string()) return std::nullopt;
    auto cursor = it->get<std::string>();
    if (cursor.empty()) return std::nullopt;
    return cursor;
}

} // anonymous namespace

std::optional<std::string> next_cursor(const Payload& payload) {
    if (const auto* doc = std::get_if<GeoDocument>(&payload)) {
        return cursor_member(doc->json());
    }
    if (const auto* j = std::get_if<nlohmann::json>(&payload)) {
        return cursor_member(*j);
    }
    // Decoded records carry no paging metadata
    return std::nullopt;
}

std::size_t page_size(const Payload& payload) {
    return std::visit([](const auto& p) -> std::size_t {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return 0;
        } else if constexpr (std::is_same_v<T, Record>) {
            return 1;
        } else if constexpr (std::is_same_v<T, std::vector<Record>>) {
            return p.size();
        } else if constexpr (std::is_same_v<T, GeoDocument>) {
            switch (p.kind()) {
                case DocumentKind::FeatureCollection:  return p.features().size();
                case DocumentKind::GeometryCollection: return p.geometries().size();
                case DocumentKind::Unknown:            return 0;
                default:                               return 1;
            }
        } else {
            if (p.is_array()) return p.size();
            if (p.is_object() && p.contains("features") && p.at("features").is_array()) {
                return p.at("features").size();
            }
            return p.is_null() ? 0 : 1;
        }
    }, payload);
}

} // namespace geodata
