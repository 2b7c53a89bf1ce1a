// l10n-sync benchmarks: measures throughput of the hot paths of a sync round.

#include <l10n-sync/l10n_sync.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace l10n_sync;

namespace {

auto make_entry(int i) -> TranslationEntry {
    auto e = TranslationEntry{};
    e.uid = "entry-" + std::to_string(i);
    e.key = "item.create.part_" + std::to_string(i);
    e.locale = "zh_cn";
    e.src_text = "Mechanical Part " + std::to_string(i);
    e.dst_text = "机械零件 " + std::to_string(i);
    e.status = EntryStatus::translated;
    e.updated_at = Timestamp{1700000000000 + i};
    return e;
}

auto make_deltas(std::size_t n) -> std::vector<EntryDelta> {
    auto deltas = std::vector<EntryDelta>{};
    deltas.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        deltas.push_back(serialize_entry_delta(make_entry(static_cast<int>(i)), DeltaOperation::update));
    }
    return deltas;
}

}  // namespace

// =============================================================================
// Identity
// =============================================================================

static void bm_uida_generate(benchmark::State& state) {
    auto encoder = UidaEncoder{};
    int i = 0;
    for (auto _ : state) {
        auto uida = encoder.generate_translation_entry_uida(
            "create", "item.create.part_" + std::to_string(i++), "zh_cn");
        benchmark::DoNotOptimize(uida);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_uida_generate);

static void bm_compute_cid(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto bytes = std::vector<std::byte>(n, std::byte{0x5A});
    for (auto _ : state) {
        benchmark::DoNotOptimize(compute_cid(bytes));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_compute_cid)->Range(64, 1 << 20);

// =============================================================================
// Bloom filter
// =============================================================================

static void bm_bloom_add(benchmark::State& state) {
    auto filter = BloomFilter{optimal_bloom_parameters(1'000'000, 0.001)};
    auto cids = std::vector<Cid>{};
    for (int i = 0; i < 1024; ++i) cids.push_back(compute_cid(std::to_string(i)));
    std::size_t i = 0;
    for (auto _ : state) {
        filter.add(cids[i++ & 1023]);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_bloom_add);

static void bm_bloom_scan(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto filter = BloomFilter{optimal_bloom_parameters(n, 0.001)};
    auto cids = std::vector<Cid>{};
    for (std::size_t i = 0; i < n; ++i) {
        cids.push_back(compute_cid(std::to_string(i)));
        if (i % 2 == 0) filter.add(cids.back());
    }
    for (auto _ : state) {
        std::size_t missing = 0;
        for (const auto& c : cids) missing += filter.might_contain(c) ? 0 : 1;
        benchmark::DoNotOptimize(missing);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_bloom_scan)->Range(1 << 10, 1 << 16);

// =============================================================================
// Payload codec
// =============================================================================

static void bm_payload_encode(benchmark::State& state) {
    auto deltas = make_deltas(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(create_delta_payload(deltas, Timestamp{1}));
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * deltas.size()));
}
BENCHMARK(bm_payload_encode)->Range(1, 4096);

static void bm_payload_decode(benchmark::State& state) {
    auto deltas = make_deltas(static_cast<std::size_t>(state.range(0)));
    auto bytes = create_delta_payload(deltas, Timestamp{1});
    for (auto _ : state) {
        benchmark::DoNotOptimize(parse_delta_payload(bytes));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * bytes.size()));
}
BENCHMARK(bm_payload_decode)->Range(1, 4096);

// =============================================================================
// Merge
// =============================================================================

static void bm_three_way_merge(benchmark::State& state) {
    auto engine = MergeEngine{};
    auto base = make_entry(1);
    auto local = base;
    local.dst_text = "本地翻译";
    auto remote = base;
    remote.status = EntryStatus::approved;
    auto ctx = MergeContext{.base = base, .local = local, .remote = remote};
    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.perform_three_way_merge(ctx));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_three_way_merge);

// =============================================================================
// Hub round trip
// =============================================================================

static void bm_hub_commit(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto hub = SyncHub{SyncConfig{}, HubServices{
        .objects = std::make_shared<InMemoryObjectStore>(),
        .entries = std::make_shared<InMemoryEntryStore>(),
    }};
    auto filter = BloomFilter{1024, 7}.to_bytes();
    std::int64_t round = 0;
    for (auto _ : state) {
        auto session_id = "bench-" + std::to_string(round);
        hub.handshake(HandshakeRequest{.client_id = "bench", .session_id = session_id,
                                       .protocol_version = "v1", .bloom_filter = filter});
        auto payload = create_delta_payload(make_deltas(n), Timestamp{round++});
        auto response = hub.commit(CommitRequest{.session_id = session_id,
                                                 .payload_cid = compute_cid(payload),
                                                 .payload = std::move(payload)});
        benchmark::DoNotOptimize(response);
        hub.complete_session(session_id);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_hub_commit)->Range(1, 1024);

static void bm_parallel_uploads(benchmark::State& state) {
    auto pool = std::make_shared<thread_pool>(std::thread::hardware_concurrency());
    auto config = SyncConfig{};
    config.chunk_size = 64 * 1024;
    auto hub = SyncHub{config, HubServices{
        .objects = std::make_shared<InMemoryObjectStore>(),
        .entries = std::make_shared<InMemoryEntryStore>(),
        .pool = pool,
    }};
    auto filter = BloomFilter{1024, 7}.to_bytes();
    std::int64_t round = 0;
    for (auto _ : state) {
        auto futures = std::vector<std::future<ChunkAck>>{};
        for (int s = 0; s < 8; ++s) {
            auto session_id = "up-" + std::to_string(round) + "-" + std::to_string(s);
            hub.handshake(HandshakeRequest{.client_id = "bench", .session_id = session_id,
                                           .protocol_version = "v1", .bloom_filter = filter});
            auto object = std::vector<std::byte>(256 * 1024, static_cast<std::byte>(round + s));
            object[0] = static_cast<std::byte>(s);
            object[1] = static_cast<std::byte>(round & 0xFF);
            object[2] = static_cast<std::byte>((round >> 8) & 0xFF);
            for (auto& chunk : split_into_chunks(session_id, object, config.chunk_size)) {
                futures.push_back(hub.async_upload_chunk(std::move(chunk)));
            }
        }
        for (auto& f : futures) benchmark::DoNotOptimize(f.get());
        ++round;
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * 8 * 256 * 1024));
}
BENCHMARK(bm_parallel_uploads)->UseRealTime();
