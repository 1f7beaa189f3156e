#include <gtest/gtest.h>
#include "geodata/client.hpp"
#include "geodata/error.hpp"
#include "geodata/pagination.hpp"
#include "fakes.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>

#include <sstream>

using namespace geodata;
using fakes::FailingSigner;
using fakes::FakeTransport;
using fakes::NullSigner;

namespace {

constexpr const char* kBase = "http://api.example.com/0.1";

nlohmann::json feature_json(const std::string& id, const std::string& layer = "com.example.test") {
    return {
        {"type", "Feature"}, {"id", id}, {"layer", layer}, {"created", 100},
        {"geometry", {{"type", "Point"}, {"coordinates", {-122.0, 37.0}}}},
        {"properties", {{"type", "object"}}}
    };
}

Record make_record(const std::string& id) {
    Record r;
    r.record_id = id;
    r.layer = "com.example.test";
    r.latitude = 37.0;
    r.longitude = -122.0;
    r.created = 100;
    return r;
}

std::string collection(std::initializer_list<std::string> ids,
                       const std::optional<std::string>& cursor = std::nullopt) {
    auto features = nlohmann::json::array();
    for (const auto& id : ids) features.push_back(feature_json(id));
    nlohmann::json fc = {{"type", "FeatureCollection"}, {"features", features}};
    if (cursor) fc["next_cursor"] = *cursor;
    return fc.dump();
}

} // namespace

class GeoClientTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::unique_ptr<GeoClient> client;

    void SetUp() override {
        client = make_client(std::make_shared<NullSigner>());
    }

    std::unique_ptr<GeoClient> make_client(std::shared_ptr<const IRequestSigner> signer) {
        GeoClient::Options opts;
        opts.base_url = kBase;
        opts.worker_threads = 2;
        opts.logger = std::make_shared<spdlog::logger>(
            "client-test", std::make_shared<spdlog::sinks::null_sink_mt>());
        return std::make_unique<GeoClient>(opts, transport, std::move(signer));
    }
};

// ---- Records ----

TEST_F(GeoClientTest, RetrieveSingleRecordUnwrapsList) {
    transport->respond_with(200, collection({"a"}));
    auto payload = resolve(client->retrieve(AnyRecord{make_record("a")}));
    ASSERT_TRUE(std::holds_alternative<Record>(payload));
    EXPECT_EQ(std::get<Record>(payload), make_record("a"));
    EXPECT_EQ(transport->last_request().uri, std::string(kBase) + "/records/com.example.test/a.json");
}

TEST_F(GeoClientTest, RetrieveSingleDocumentUnwrapsCollection) {
    transport->respond_with(200, collection({"a"}));
    auto payload = resolve(client->retrieve(AnyRecord{GeoDocument(feature_json("a"))}));
    ASSERT_TRUE(std::holds_alternative<GeoDocument>(payload));
    EXPECT_TRUE(std::get<GeoDocument>(payload).is_feature());
}

TEST_F(GeoClientTest, RetrieveSingleSameInBothModes) {
    transport->respond_with(200, collection({"a"}));
    auto sync_payload = resolve(client->retrieve(AnyRecord{make_record("a")}));
    client->set_mode(ExecutionMode::Deferred);
    EXPECT_EQ(client->mode(), ExecutionMode::Deferred);
    auto reply = client->retrieve(AnyRecord{make_record("a")});
    EXPECT_TRUE(is_deferred(reply));
    EXPECT_EQ(resolve(reply), sync_payload);
}

TEST_F(GeoClientTest, RetrieveListJoinsIds) {
    transport->respond_with(200, collection({"a", "b", "c"}));
    std::vector<AnyRecord> records{make_record("a"), make_record("b"), make_record("c")};
    auto payload = resolve(client->retrieve(records));
    ASSERT_TRUE(std::holds_alternative<std::vector<Record>>(payload));
    EXPECT_EQ(std::get<std::vector<Record>>(payload).size(), 3u);
    EXPECT_EQ(transport->last_request().uri, std::string(kBase) + "/records/com.example.test/a,b,c.json");
}

TEST_F(GeoClientTest, RetrieveWithoutLayerSendsNothing) {
    Record r = make_record("a");
    r.layer.clear();
    EXPECT_THROW((void)client->retrieve(AnyRecord{r}), GeoInvalidRequestError);
    EXPECT_EQ(transport->calls(), 0);
}

TEST_F(GeoClientTest, UpdateRecordPostsFeature) {
    transport->respond_with(204, "");
    auto payload = resolve(client->update(AnyRecord{make_record("a")}));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(payload));

    auto req = transport->last_request();
    EXPECT_EQ(req.method, HttpMethod::Post);
    EXPECT_EQ(req.uri, std::string(kBase) + "/records/com.example.test.json");
    EXPECT_EQ(nlohmann::json::parse(req.body)["type"], "Feature");
}

TEST_F(GeoClientTest, UpdateListPostsCollection) {
    transport->respond_with(204, "");
    std::vector<AnyRecord> records{make_record("a"), GeoDocument(feature_json("b"))};
    (void)resolve(client->update(records));
    auto body = nlohmann::json::parse(transport->last_request().body);
    EXPECT_EQ(body["type"], "FeatureCollection");
    EXPECT_EQ(body["features"].size(), 2u);
}

TEST_F(GeoClientTest, RemoveMissingRecord) {
    transport->respond_with(404, R"({"code":404,"message":"No such record"})");
    EXPECT_THROW((void)client->remove(AnyRecord{make_record("gone")}), GeoNoSuchRecordError);
    auto req = transport->last_request();
    EXPECT_EQ(req.method, HttpMethod::Delete);
    EXPECT_EQ(req.uri, std::string(kBase) + "/records/com.example.test/gone.json");
}

TEST_F(GeoClientTest, RemoveMissingRecordDeferred) {
    transport->respond_with(404, R"({"code":404,"message":"No such record"})");
    client->set_mode(ExecutionMode::Deferred);
    auto reply = client->remove("com.example.test", "gone", HandlerType::Json);
    EXPECT_EQ(error_kind(std::get<Deferred>(reply).error()), ErrorKind::NoSuchRecord);
}

// ---- Unsupported handler combinations ----

TEST_F(GeoClientTest, UnsupportedCombinationsNeverSend) {
    HistoryQuery history("a", "com.example.test");
    EXPECT_THROW((void)client->history(history, HandlerType::Json), GeoUnsupportedOperationError);
    EXPECT_THROW((void)client->history(history, HandlerType::Record), GeoUnsupportedOperationError);
    EXPECT_THROW((void)client->contains(37.0, -122.0, HandlerType::GeoJson), GeoUnsupportedOperationError);
    EXPECT_THROW((void)client->overlaps(Envelope(-1, -1, 1, 1), 10, std::nullopt, HandlerType::GeoJson),
                 GeoUnsupportedOperationError);

    client->set_mode(ExecutionMode::Deferred);
    EXPECT_THROW((void)client->contains(37.0, -122.0, HandlerType::Record), GeoUnsupportedOperationError);
    EXPECT_EQ(transport->calls(), 0);
}

TEST_F(GeoClientTest, UnsupportedOperationCode) {
    try {
        (void)client->contains(37.0, -122.0, HandlerType::GeoJson);
        FAIL() << "expected GeoUnsupportedOperationError";
    } catch (const GeoApiError& e) {
        EXPECT_EQ(e.code, error::BadRequest);
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedOperation);
    }
}

// ---- Queries ----

TEST_F(GeoClientTest, NearbyPagination) {
    transport = std::make_shared<FakeTransport>([](const HttpRequest& req) {
        if (req.uri.find("cursor=page2") != std::string::npos) {
            return HttpResponse{200, collection({"c"})};
        }
        return HttpResponse{200, collection({"a", "b"}, std::string("page2"))};
    });
    client = make_client(std::make_shared<NullSigner>());

    GeohashNearbyQuery query("9q8yy", "com.example.test", {}, 2);
    std::vector<std::string> seen;
    int pages = 0;
    for (;;) {
        auto payload = resolve(client->nearby(query));
        ++pages;
        for (const auto& f : std::get<GeoDocument>(payload).features()) {
            seen.push_back(f["id"].get<std::string>());
        }
        auto cursor = next_cursor(payload);
        if (!cursor) break;
        query.set_cursor(cursor);
    }

    EXPECT_EQ(pages, 2);
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));
    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].uri.find("cursor="), std::string::npos);
    EXPECT_NE(requests[1].uri.find("cursor=page2"), std::string::npos);
}

TEST_F(GeoClientTest, NearbyNextPageWithLargerLimit) {
    transport = std::make_shared<FakeTransport>([](const HttpRequest& req) {
        if (req.uri.find("cursor=page2") != std::string::npos) {
            return HttpResponse{200, collection({"c", "d", "e", "f"}, std::string("page3"))};
        }
        return HttpResponse{200, collection({"a", "b"}, std::string("page2"))};
    });
    client = make_client(std::make_shared<NullSigner>());

    GeohashNearbyQuery query("9q8yy", "com.example.test", {}, 2);
    auto first = resolve(client->nearby(query));
    EXPECT_EQ(page_size(first), 2u);

    query.set_cursor(next_cursor(first));
    query.set_limit(4);
    auto second = resolve(client->nearby(query));
    EXPECT_EQ(page_size(second), 4u);
    EXPECT_NE(page_size(second), page_size(first));
    EXPECT_EQ(next_cursor(second), std::optional<std::string>("page3"));

    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].uri,
              std::string(kBase) + "/records/com.example.test/nearby/9q8yy.json?limit=2");
    EXPECT_EQ(requests[1].uri,
              std::string(kBase) + "/records/com.example.test/nearby/9q8yy.json?cursor=page2&limit=4");
}

TEST_F(GeoClientTest, HistoryGeoJson) {
    transport->respond_with(200, R"({"type":"GeometryCollection","geometries":[
        {"type":"Point","coordinates":[1,2]}]})");
    auto payload = resolve(client->history(HistoryQuery("a", "com.example.test", 10)));
    EXPECT_TRUE(std::get<GeoDocument>(payload).is_geometry_collection());
    EXPECT_EQ(transport->last_request().uri,
              std::string(kBase) + "/records/com.example.test/a/history.json?limit=10");
}

// ---- Places ----

TEST_F(GeoClientTest, DensityUsesRequestedHandler) {
    transport->respond_with(200, R"({"type":"Feature","properties":{"dow":"mon"}})");
    auto payload = resolve(client->density(Weekday::Monday, 8, 37.0, -122.0, HandlerType::Json));
    EXPECT_TRUE(std::holds_alternative<nlohmann::json>(payload));
    EXPECT_EQ(transport->last_request().uri,
              std::string(kBase) + "/density/mon/8/37.000000,-122.000000.json");
}

TEST_F(GeoClientTest, ContainsAndOverlapsJson) {
    transport->respond_with(200, R"([{"id":"SG_1","name":"Mission"}])");
    auto contains = resolve(client->contains(37.0, -122.0));
    EXPECT_TRUE(std::get<nlohmann::json>(contains).is_array());

    auto overlaps = resolve(client->overlaps(Envelope(-122.5, 37.7, -122.3, 37.8), 5, std::string("City")));
    EXPECT_EQ(std::get<nlohmann::json>(overlaps)[0]["name"], "Mission");
    EXPECT_NE(transport->last_request().uri.find("?limit=5&type=City"), std::string::npos);
}

TEST_F(GeoClientTest, ReverseGeocodeAndBoundary) {
    transport->respond_with(200, R"({"type":"Feature","properties":{"city":"San Francisco"}})");
    auto address = resolve(client->reverse_geocode(37.0, -122.0));
    EXPECT_EQ(std::get<GeoDocument>(address).properties()["city"], "San Francisco");

    auto boundary = resolve(client->boundary("SG_1"));
    EXPECT_TRUE(std::get<GeoDocument>(boundary).is_feature());
    EXPECT_EQ(transport->last_request().uri, std::string(kBase) + "/boundary/SG_1.json");
}

// ---- Handlers / signing ----

TEST_F(GeoClientTest, CustomHandlerUsedForOperation) {
    class Tagging : public ResponseHandler {
    public:
        Payload decode(const HttpResponse&) const override { return nlohmann::json("tagged"); }
    };
    client->set_handler(HandlerType::GeoJson, std::make_shared<const Tagging>());
    auto payload = resolve(client->boundary("SG_1"));
    EXPECT_EQ(std::get<nlohmann::json>(payload), "tagged");
}

TEST_F(GeoClientTest, SigningFailureIsNotAuthorized) {
    auto signer = std::make_shared<FailingSigner>();
    client = make_client(signer);
    EXPECT_THROW((void)client->boundary("SG_1"), GeoNotAuthorizedError);
    EXPECT_EQ(transport->calls(), 0);
    EXPECT_EQ(signer->attempts.load(), 1);
}

TEST(GeoClientDefaults, MissingCredentialsFailBeforeNetwork) {
    GeoClient::Options opts;
    opts.base_url = "http://127.0.0.1:1/0.1";
    opts.logger = std::make_shared<spdlog::logger>(
        "client-defaults", std::make_shared<spdlog::sinks::null_sink_mt>());
    GeoClient client(opts);
    EXPECT_EQ(client.request_builder().base_url(), "http://127.0.0.1:1/0.1");
    EXPECT_THROW((void)client.boundary("SG_1"), GeoNotAuthorizedError);
}

TEST(GeoClientDefaults, DefaultServiceRoot) {
    GeoClient::Options opts;
    EXPECT_EQ(opts.base_url, std::string(DEFAULT_BASE_URL));
}

TEST(GeoClientLogging, ExtractionAndRegistryUseClientLogger) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    GeoClient::Options opts;
    opts.base_url = kBase;
    opts.worker_threads = 1;
    opts.logger = std::make_shared<spdlog::logger>("client-capture", sink);
    opts.logger->set_level(spdlog::level::debug);
    opts.logger->set_pattern("[%l] %v");
    auto transport = std::make_shared<FakeTransport>();
    GeoClient client(opts, transport, std::make_shared<NullSigner>());

    AnyRecord no_layer = GeoDocument(nlohmann::json{{"type", "Feature"}, {"id", "a"}});
    EXPECT_THROW((void)client.retrieve(no_layer), GeoInvalidRequestError);
    client.set_handler(HandlerType::Base, std::make_shared<const JsonHandler>());

    const std::string logged = out.str();
    EXPECT_NE(logged.find("[debug] unable to locate layer"), std::string::npos);
    EXPECT_NE(logged.find("[warning] ignoring replacement of the base handler"), std::string::npos);
    EXPECT_EQ(transport->calls(), 0);
}
