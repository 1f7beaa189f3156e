#include "geodata/auth/signer.hpp"
#include "geodata/error.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace geodata {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

// Inverse of form_encode for query string components
std::string form_decode(const std::string& value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char ch = value[i];
        if (ch == '+') {
            decoded.push_back(' ');
        } else if (ch == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0
                   && hex_value(value[i + 2]) >= 0) {
            decoded.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
            i += 2;
        } else {
            decoded.push_back(ch);
        }
    }
    return decoded;
}

std::vector<std::pair<std::string, std::string>> query_params(const std::string& query) {
    std::vector<std::pair<std::string, std::string>> params;
    size_t start = 0;
    while (start < query.size()) {
        size_t end = query.find('&', start);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            if (eq == std::string::npos) {
                params.emplace_back(form_decode(pair), "");
            } else {
                params.emplace_back(form_decode(pair.substr(0, eq)), form_decode(pair.substr(eq + 1)));
            }
        }
        start = end + 1;
    }
    return params;
}

std::string random_nonce() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << dis(gen) << std::setw(16) << dis(gen);
    return oss.str();
}

int64_t unix_time() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

OAuthSigner::OAuthSigner(Credentials credentials)
    : OAuthSigner(std::move(credentials), random_nonce, unix_time) {}

OAuthSigner::OAuthSigner(Credentials credentials, NonceSource nonce, ClockSource clock)
    : credentials_(std::move(credentials))
    , nonce_(std::move(nonce))
    , clock_(std::move(clock)) {}

std::string OAuthSigner::percent_encode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (unsigned char ch : value) {
        if (std::isalnum(ch) != 0 || ch == '-' || ch == '.' || ch == '_' || ch == '~') {
            encoded.push_back(static_cast<char>(ch));
        } else {
            encoded.push_back('%');
            encoded.push_back(kHexDigits[(ch >> 4) & 0x0F]);
            encoded.push_back(kHexDigits[ch & 0x0F]);
        }
    }
    return encoded;
}

std::string OAuthSigner::signature_base_string(
    const HttpRequest& request,
    const std::vector<std::pair<std::string, std::string>>& oauth_params) {
    std::string base_uri = request.uri;
    std::string query;
    auto qpos = base_uri.find('?');
    if (qpos != std::string::npos) {
        query = base_uri.substr(qpos + 1);
        base_uri.erase(qpos);
    }

    std::vector<std::pair<std::string, std::string>> params;
    for (auto& [k, v] : query_params(query)) {
        params.emplace_back(percent_encode(k), percent_encode(v));
    }
    for (const auto& [k, v] : oauth_params) {
        params.emplace_back(percent_encode(k), percent_encode(v));
    }
    std::sort(params.begin(), params.end());

    std::string normalized;
    for (const auto& [k, v] : params) {
        if (!normalized.empty()) normalized += '&';
        normalized += k + "=" + v;
    }

    return http_method_to_string(request.method) + "&" + percent_encode(base_uri) + "&"
           + percent_encode(normalized);
}

std::string OAuthSigner::hmac_sha1_base64(const std::string& key, const std::string& text) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (!HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(text.data()), text.size(),
              digest, &digest_len)) {
        throw GeoSigningError("HMAC-SHA1 computation failed");
    }

    std::string encoded(4 * ((digest_len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), digest,
                                  static_cast<int>(digest_len));
    if (written < 0) {
        throw GeoSigningError("base64 encoding failed");
    }
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

void OAuthSigner::sign(HttpRequest& request) const {
    if (credentials_.consumer_key.empty() || credentials_.consumer_secret.empty()) {
        throw GeoSigningError("OAuth consumer key and secret are required");
    }

    std::vector<std::pair<std::string, std::string>> oauth_params = {
        {"oauth_consumer_key", credentials_.consumer_key},
        {"oauth_nonce", nonce_()},
        {"oauth_signature_method", "HMAC-SHA1"},
        {"oauth_timestamp", std::to_string(clock_())},
        {"oauth_version", "1.0"},
    };

    // Two-legged: the token secret is empty
    const std::string key = percent_encode(credentials_.consumer_secret) + "&";
    const std::string signature = hmac_sha1_base64(key, signature_base_string(request, oauth_params));
    oauth_params.emplace_back("oauth_signature", signature);
    std::sort(oauth_params.begin(), oauth_params.end());

    std::string header = "OAuth ";
    bool first = true;
    for (const auto& [k, v] : oauth_params) {
        if (!first) header += ", ";
        header += k + "=\"" + percent_encode(v) + "\"";
        first = false;
    }
    request.headers["Authorization"] = header;
}

} // namespace geodata
