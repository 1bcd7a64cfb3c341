#include <benchmark/benchmark.h>
#include "core/encoding.hpp"
#include "model/interaction.hpp"
#include <random>

using namespace mirage;

// Fingerprint of a request with the given body size
static void BM_Fingerprint(benchmark::State& state) {
    model::RecordedRequest request;
    request.method = "POST";
    request.url = "api.example.com/users?page=1";
    request.body = std::string(static_cast<std::size_t>(state.range(0)), 'x');

    for (auto _ : state) {
        benchmark::DoNotOptimize(request.fingerprint());
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Fingerprint)->Range(0, 1 << 20);

// Base64 encoding of binary bodies
static void BM_Base64Encode(benchmark::State& state) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> byte_dist(0, 255);

    std::string body(static_cast<std::size_t>(state.range(0)), '\0');
    for (auto& c : body) {
        c = static_cast<char>(byte_dist(rng));
    }

    for (auto _ : state) {
        benchmark::DoNotOptimize(base64_encode(body));
    }
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Base64Encode)->Range(64, 1 << 20);

// Full interaction serialization as written to disk
static void BM_InteractionToJson(benchmark::State& state) {
    model::Interaction interaction;
    interaction.id = model::generate_interaction_id();
    interaction.timestamp = std::chrono::system_clock::now();
    interaction.request.method = "GET";
    interaction.request.url = "api.example.com/users/1";
    interaction.request.headers["Accept"] = {"application/json"};
    interaction.response.status_code = 200;
    interaction.response.headers["Content-Type"] = {"application/json"};
    interaction.response.body = std::string(static_cast<std::size_t>(state.range(0)), 'y');
    interaction.metadata.target = interaction.request.url;

    for (auto _ : state) {
        benchmark::DoNotOptimize(nlohmann::json(interaction).dump(2));
    }
}
BENCHMARK(BM_InteractionToJson)->Range(64, 1 << 16);

BENCHMARK_MAIN();
