#include "geodata/transport/transport.hpp"

namespace geodata {

std::string http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

} // namespace geodata
