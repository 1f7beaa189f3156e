#pragma once
#include "transport.hpp"
#include <chrono>
#include <string>
#include <utility>

namespace geodata {

/// HTTP client transport backed by cpp-httplib. Each call opens its own
/// httplib::Client, so concurrent calls from the worker pool share nothing.
class HttpClientTransport : public IHttpTransport {
public:
    struct Options {
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds read_timeout{60};
        std::string user_agent;
    };

    /// base_url is the scheme://host[:port] that every request URI must start with.
    HttpClientTransport(const std::string& base_url, Options opts);
    explicit HttpClientTransport(const std::string& base_url);
    ~HttpClientTransport() override;

    HttpClientTransport(const HttpClientTransport&) = delete;
    HttpClientTransport& operator=(const HttpClientTransport&) = delete;

    [[nodiscard]] HttpResponse execute(const HttpRequest& request) override;

    [[nodiscard]] const std::string& origin() const noexcept { return origin_; }

private:
    std::string origin_;
    Options opts_;
};

/// Split "http://host:port/a/b?c" into origin "http://host:port" and the rest.
/// Throws GeoInvalidRequestError when the URL has no http(s) scheme.
[[nodiscard]] std::pair<std::string, std::string> split_url(const std::string& url);

} // namespace geodata
