#include "geodata/codec.hpp"
#include "geodata/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>
#include <utility>

namespace geodata {

namespace {

void check(simdjson::error_code error, const char* what) {
    if (error) {
        throw GeoMalformedResponseError(std::string(what) + ": " + simdjson::error_message(error));
    }
}

nlohmann::json to_nlohmann(simdjson::ondemand::value val);

nlohmann::json object_to_nlohmann(simdjson::ondemand::value val) {
    simdjson::ondemand::object object;
    check(val.get_object().get(object), "Invalid object");

    nlohmann::json out = nlohmann::json::object();
    for (auto entry : object) {
        simdjson::ondemand::field field;
        check(std::move(entry).get(field), "Invalid object member");
        std::string_view key;
        check(field.unescaped_key().get(key), "Invalid member name");
        out[std::string(key)] = to_nlohmann(field.value());
    }
    return out;
}

nlohmann::json array_to_nlohmann(simdjson::ondemand::value val) {
    simdjson::ondemand::array array;
    check(val.get_array().get(array), "Invalid array");

    nlohmann::json out = nlohmann::json::array();
    for (auto entry : array) {
        simdjson::ondemand::value element;
        check(entry.get(element), "Invalid array element");
        out.push_back(to_nlohmann(element));
    }
    return out;
}

// Ids and timestamps stay integral, coordinates stay floating point
nlohmann::json number_to_nlohmann(simdjson::ondemand::value val) {
    int64_t as_int = 0;
    if (val.get_int64().get(as_int) == simdjson::SUCCESS) return as_int;
    uint64_t as_uint = 0;
    if (val.get_uint64().get(as_uint) == simdjson::SUCCESS) return as_uint;
    double as_double = 0;
    check(val.get_double().get(as_double), "Invalid number");
    return as_double;
}

nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    simdjson::ondemand::json_type type;
    check(val.type().get(type), "Invalid value");

    switch (type) {
        case simdjson::ondemand::json_type::object:
            return object_to_nlohmann(val);
        case simdjson::ondemand::json_type::array:
            return array_to_nlohmann(val);
        case simdjson::ondemand::json_type::number:
            return number_to_nlohmann(val);
        case simdjson::ondemand::json_type::string: {
            std::string_view text;
            check(val.get_string().get(text), "Invalid string");
            return std::string(text);
        }
        case simdjson::ondemand::json_type::boolean: {
            bool flag = false;
            check(val.get_bool().get(flag), "Invalid boolean");
            return flag;
        }
        case simdjson::ondemand::json_type::null:
            return nullptr;
    }
    throw GeoMalformedResponseError("Unknown JSON value type");
}

// Converts the single top-level value and requires that nothing follows it
nlohmann::json document_to_nlohmann(simdjson::ondemand::document& doc) {
    // Top-level scalars fail here with SCALAR_DOCUMENT_AS_VALUE
    simdjson::ondemand::value root;
    check(doc.get_value().get(root), "JSON parse error");

    nlohmann::json out = to_nlohmann(root);
    if (!doc.at_end()) {
        throw GeoMalformedResponseError("JSON parse error: trailing content after document");
    }
    return out;
}

} // anonymous namespace

nlohmann::json Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw GeoMalformedResponseError("Empty response body");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    check(parser.iterate(padded).get(doc), "JSON parse error");

    try {
        return document_to_nlohmann(doc);
    } catch (const simdjson::simdjson_error& e) {
        throw GeoMalformedResponseError(std::string("JSON conversion error: ") + e.what());
    }
}

std::string Codec::serialize(const nlohmann::json& j) {
    return j.dump();
}

} // namespace geodata
