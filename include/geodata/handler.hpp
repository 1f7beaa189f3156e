#pragma once
#include "types.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <string>

namespace geodata {

/// Selects the decoder applied to an operation's response.
enum class HandlerType { Json, GeoJson, Record, Base };

std::string handler_type_to_string(HandlerType type);

/// Base (protocol) handler. handle() applies the status check shared by every
/// operation and then the virtual decode(); the base decode() returns the raw
/// JSON body, or nothing when the body is empty.
class ResponseHandler {
public:
    virtual ~ResponseHandler() = default;

    /// Throws the typed error described by a failed response, otherwise decodes it.
    [[nodiscard]] Payload handle(const HttpResponse& response) const;

    /// Decode a successful (2xx) response. Throws GeoMalformedResponseError.
    [[nodiscard]] virtual Payload decode(const HttpResponse& response) const;

    /// Raise the error for a status >= 400. A {"code","message"} body takes
    /// precedence over the HTTP status line.
    static void check_status(const HttpResponse& response);
};

/// Raw JSON array or object.
class JsonHandler : public ResponseHandler {
public:
    [[nodiscard]] Payload decode(const HttpResponse& response) const override;
};

/// JSON object carrying a GeoJSON "type" discriminator.
class GeoJsonHandler : public ResponseHandler {
public:
    [[nodiscard]] Payload decode(const HttpResponse& response) const override;
};

/// Feature -> Record, FeatureCollection -> list of Records.
class RecordHandler : public ResponseHandler {
public:
    [[nodiscard]] Payload decode(const HttpResponse& response) const override;
};

using HandlerPtr = std::shared_ptr<const ResponseHandler>;

} // namespace geodata
