#include <benchmark/benchmark.h>
#include "geodata/auth/signer.hpp"
#include "geodata/query.hpp"
#include "geodata/request_builder.hpp"
#include <string>

using namespace geodata;

static const RequestBuilder kBuilder{"http://api.simplegeo.com/0.1"};

static void BM_BuildRetrieve(benchmark::State& state) {
    const std::optional<std::string> layer = "com.example.bench";
    const std::optional<std::string> ids = "a,b,c,d,e";
    for (auto _ : state) {
        auto req = kBuilder.retrieve(layer, ids);
        benchmark::DoNotOptimize(req);
    }
}
BENCHMARK(BM_BuildRetrieve);

static void BM_BuildNearbyQuery(benchmark::State& state) {
    LatLonNearbyQuery query(37.7749, -122.4194, 2.5, "com.example.bench",
                            {"object", "place", "person"}, 50, std::string("cursor-token"));
    for (auto _ : state) {
        auto req = kBuilder.query(query);
        benchmark::DoNotOptimize(req);
    }
}
BENCHMARK(BM_BuildNearbyQuery);

static void BM_FormEncode(benchmark::State& state) {
    const std::string value = "coffee & tea / bakeries near 37.7749,-122.4194";
    for (auto _ : state) {
        auto encoded = form_encode(value);
        benchmark::DoNotOptimize(encoded);
    }
    state.SetBytesProcessed(state.iterations() * value.size());
}
BENCHMARK(BM_FormEncode);

static void BM_SignRequest(benchmark::State& state) {
    OAuthSigner signer(OAuthSigner::Credentials{"bench-key", "bench-secret"},
                       [] { return std::string("nonce"); },
                       [] { return int64_t{1300000000}; });
    LatLonNearbyQuery query(37.7749, -122.4194, 2.5, "com.example.bench", {}, 50);
    const HttpRequest base = kBuilder.query(query);
    for (auto _ : state) {
        HttpRequest req = base;
        signer.sign(req);
        benchmark::DoNotOptimize(req);
    }
}
BENCHMARK(BM_SignRequest);
