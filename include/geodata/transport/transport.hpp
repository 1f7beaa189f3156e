#pragma once
#include <map>
#include <string>

namespace geodata {

enum class HttpMethod { Get, Post, Delete };

std::string http_method_to_string(HttpMethod method);

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string uri;            // absolute, query string included
    std::string body;
    std::string content_type;
    std::map<std::string, std::string> headers;

    bool operator==(const HttpRequest& o) const {
        return method == o.method && uri == o.uri && body == o.body
               && content_type == o.content_type && headers == o.headers;
    }
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

/// Abstract transport interface: one blocking request/response exchange.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /// Send the request and return whatever status the server answered with.
    /// Throws GeoTransportError when no response could be obtained.
    [[nodiscard]] virtual HttpResponse execute(const HttpRequest& request) = 0;
};

} // namespace geodata
