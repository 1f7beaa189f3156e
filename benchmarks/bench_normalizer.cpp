#include <benchmark/benchmark.h>
#include "geodata/codec.hpp"
#include "geodata/normalizer.hpp"
#include <string>
#include <vector>

using namespace geodata;

static std::vector<AnyRecord> make_records(int n) {
    std::vector<AnyRecord> records;
    records.reserve(n);
    for (int i = 0; i < n; ++i) {
        Record r;
        r.record_id = "record-" + std::to_string(i);
        r.layer = "com.example.bench";
        r.latitude = 37.0 + i * 0.001;
        r.longitude = -122.0 - i * 0.001;
        r.created = 1270000000 + i;
        r.properties = {{"name", "Place " + std::to_string(i)}, {"rating", i % 5}};
        records.emplace_back(std::move(r));
    }
    return records;
}

// ---- Normalize benchmarks ----

static void BM_NormalizeSingleRecord(benchmark::State& state) {
    AnyRecord record = make_records(1).front();
    for (auto _ : state) {
        auto normalized = RecordNormalizer::normalize(record);
        benchmark::DoNotOptimize(normalized);
    }
}
BENCHMARK(BM_NormalizeSingleRecord);

static void BM_NormalizeRecordList(benchmark::State& state) {
    auto records = make_records(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto normalized = RecordNormalizer::normalize(records);
        benchmark::DoNotOptimize(normalized);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_NormalizeRecordList)->Arg(10)->Arg(100)->Arg(1000);

// ---- Decode benchmarks ----

static void BM_DecodeFeatureCollection(benchmark::State& state) {
    auto records = make_records(static_cast<int>(state.range(0)));
    const std::string body = RecordNormalizer::to_document(records).dump();
    for (auto _ : state) {
        auto decoded = RecordNormalizer::to_records(GeoDocument(Codec::parse(body)));
        benchmark::DoNotOptimize(decoded);
    }
    state.SetBytesProcessed(state.iterations() * body.size());
}
BENCHMARK(BM_DecodeFeatureCollection)->Arg(10)->Arg(100)->Arg(1000);
