#include "geodata/transport/http_transport.hpp"
#include "geodata/error.hpp"
#include "geodata/version.hpp"

#include <httplib.h>

namespace geodata {

std::pair<std::string, std::string> split_url(const std::string& url) {
    std::string::size_type scheme_end = std::string::npos;
    if (url.rfind("http://", 0) == 0) {
        scheme_end = 7;
    } else if (url.rfind("https://", 0) == 0) {
        scheme_end = 8;
    }
    if (scheme_end == std::string::npos) {
        throw GeoInvalidRequestError("URL must start with http:// or https://: " + url);
    }

    auto path_start = url.find_first_of("/?", scheme_end);
    if (path_start == std::string::npos) {
        return {url, "/"};
    }
    std::string rest = url.substr(path_start);
    if (rest.front() == '?') rest.insert(rest.begin(), '/');
    return {url.substr(0, path_start), rest};
}

// ---------- HttpClientTransport ----------

HttpClientTransport::HttpClientTransport(const std::string& base_url, Options opts)
    : origin_(split_url(base_url).first)
    , opts_(std::move(opts)) {
    if (opts_.user_agent.empty()) opts_.user_agent = std::string(USER_AGENT);
}

HttpClientTransport::HttpClientTransport(const std::string& base_url)
    : HttpClientTransport(base_url, Options{}) {}

HttpClientTransport::~HttpClientTransport() = default;

HttpResponse HttpClientTransport::execute(const HttpRequest& request) {
    const auto parts = split_url(request.uri);
    const std::string& target = parts.second;
    if (parts.first != origin_) {
        throw GeoInvalidRequestError("Request URI " + request.uri + " is not under " + origin_);
    }

    httplib::Client client(origin_);
    client.set_connection_timeout(opts_.connect_timeout);
    client.set_read_timeout(opts_.read_timeout);

    httplib::Headers headers;
    for (const auto& [name, value] : request.headers) {
        headers.emplace(name, value);
    }
    headers.emplace("User-Agent", opts_.user_agent);
    headers.emplace("Accept", "application/json");

    const std::string content_type = request.content_type.empty()
        ? std::string("application/json") : request.content_type;

    auto send = [&]() -> httplib::Result {
        switch (request.method) {
            case HttpMethod::Post:
                return client.Post(target, headers, request.body, content_type);
            case HttpMethod::Delete:
                return client.Delete(target, headers);
            case HttpMethod::Get:
                break;
        }
        return client.Get(target, headers);
    };

    auto result = send();
    if (!result) {
        throw GeoTransportError("HTTP " + http_method_to_string(request.method) + " "
                                + request.uri + " failed: " + httplib::to_string(result.error()));
    }

    return HttpResponse{result->status, result->body};
}

} // namespace geodata
