#pragma once
#include "../transport/transport.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace geodata {

/// Authenticates an outbound request in place.
/// Throws GeoSigningError when the request cannot be signed.
class IRequestSigner {
public:
    virtual ~IRequestSigner() = default;

    virtual void sign(HttpRequest& request) const = 0;
};

/// Two-legged OAuth 1.0a (HMAC-SHA1, empty token) signer.
class OAuthSigner : public IRequestSigner {
public:
    struct Credentials {
        std::string consumer_key;
        std::string consumer_secret;
    };

    using NonceSource = std::function<std::string()>;
    using ClockSource = std::function<int64_t()>;

    explicit OAuthSigner(Credentials credentials);
    /// Fixed nonce/clock sources make signatures reproducible in tests.
    OAuthSigner(Credentials credentials, NonceSource nonce, ClockSource clock);

    void sign(HttpRequest& request) const override;

    /// Signature base string for the given request and oauth_* parameters.
    [[nodiscard]] static std::string signature_base_string(
        const HttpRequest& request,
        const std::vector<std::pair<std::string, std::string>>& oauth_params);

    /// base64(HMAC-SHA1(key, text)).
    [[nodiscard]] static std::string hmac_sha1_base64(const std::string& key, const std::string& text);

    /// RFC 3986 percent-encoding as required by OAuth (unreserved kept).
    [[nodiscard]] static std::string percent_encode(const std::string& value);

private:
    Credentials credentials_;
    NonceSource nonce_;
    ClockSource clock_;
};

} // namespace geodata
