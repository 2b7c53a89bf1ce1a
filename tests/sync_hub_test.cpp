#include <l10n-sync/bloom_filter.hpp>
#include <l10n-sync/content_address.hpp>
#include <l10n-sync/error.hpp>
#include <l10n-sync/memory_store.hpp>
#include <l10n-sync/sync_hub.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace l10n_sync;
using namespace std::chrono_literals;

namespace {

auto bytes_of(std::string_view s) -> std::vector<std::byte> {
    auto p = reinterpret_cast<const std::byte*>(s.data());
    return {p, p + s.size()};
}

auto entry(std::string uid, std::string dst) -> TranslationEntry {
    auto e = TranslationEntry{};
    e.uid = std::move(uid);
    e.key = "item.create." + e.uid;
    e.locale = "zh_cn";
    e.src_text = "Part";
    e.dst_text = std::move(dst);
    e.status = EntryStatus::translated;
    return e;
}

auto payload_of(std::vector<EntryDelta> deltas, Timestamp at = Timestamp{1}) -> std::vector<std::byte> {
    return create_delta_payload(deltas, at);
}

auto filter_of(const std::vector<Cid>& cids) -> std::vector<std::byte> {
    auto filter = BloomFilter{1 << 16, 7};
    for (const auto& c : cids) filter.add(c);
    return filter.to_bytes();
}

auto commit_request(std::string session_id, const std::vector<std::byte>& payload) -> CommitRequest {
    return CommitRequest{
        .session_id = std::move(session_id),
        .payload_cid = compute_cid(payload),
        .payload = payload,
    };
}

// Entry store that always reports a stale revision.
class StaleEntryStore : public InMemoryEntryStore {
public:
    auto commit_batch(std::span<const EntryWrite>, std::optional<PayloadRecord>)
        -> CommitOutcome override {
        throw ConcurrentCommitError{"", "stale revision"};
    }
};

// Entry store that runs a hook on every lookup, between the start of a
// commit and its batch write.
class HookedEntryStore : public InMemoryEntryStore {
public:
    auto get(std::string_view uid) const -> std::optional<StoredEntry> override {
        if (on_lookup) on_lookup();
        return InMemoryEntryStore::get(uid);
    }

    std::function<void()> on_lookup;
};

class SyncHubTest : public ::testing::Test {
protected:
    SyncHubTest() {
        config.chunk_size = 64;
        config.session_ttl = 10min;
        config.idempotency_retention = 1h;
    }

    auto make_hub() -> std::unique_ptr<SyncHub> {
        return std::make_unique<SyncHub>(config, HubServices{
            .objects = objects,
            .entries = entries,
            .executor = nullptr,
            .pool = nullptr,
            .metrics = metrics,
            .locks = nullptr,
            .clock = [this] { return now; },
        });
    }

    auto open(SyncHub& hub, std::string session_id, std::vector<Cid> client_has = {})
        -> HandshakeResponse {
        return hub.handshake(HandshakeRequest{
            .client_id = "client-a",
            .session_id = std::move(session_id),
            .protocol_version = "v1",
            .bloom_filter = filter_of(client_has),
        });
    }

    SyncConfig config;
    Timestamp now{1'000'000};
    std::shared_ptr<InMemoryObjectStore> objects = std::make_shared<InMemoryObjectStore>();
    std::shared_ptr<InMemoryEntryStore> entries = std::make_shared<InMemoryEntryStore>();
    std::shared_ptr<MetricsCollector> metrics = std::make_shared<MetricsCollector>();
};

}  // namespace

// -- Construction -------------------------------------------------------------

TEST_F(SyncHubTest, requires_stores_and_valid_config) {
    EXPECT_THROW((SyncHub{config, HubServices{.objects = objects}}), std::invalid_argument);
    config.chunk_size = 0;
    EXPECT_THROW(make_hub(), ConfigError);
}

// -- Handshake ----------------------------------------------------------------

TEST_F(SyncHubTest, handshake_reports_objects_the_client_lacks) {
    auto a = objects->put(bytes_of("object a"));
    auto b = objects->put(bytes_of("object b"));
    auto hub = make_hub();

    auto reply = open(*hub, "s1", {a});
    EXPECT_EQ(reply.session_id, "s1");
    EXPECT_EQ(reply.missing_cids, std::vector<Cid>{b});
    EXPECT_EQ(reply.chunk_size, 64u);
    EXPECT_EQ(reply.session_expires_at, now + 10min);
    EXPECT_FALSE(reply.full_resync_recommended);
    EXPECT_EQ(reply.capabilities.supported_versions, std::vector<std::string>{"v1"});
    EXPECT_EQ(hub->session_status("s1").status, SessionStatus::active);
    EXPECT_EQ(metrics->snapshot().handshakes, 1u);
}

TEST_F(SyncHubTest, saturated_filter_recommends_full_resync) {
    auto hub = make_hub();
    auto tiny = BloomFilter{64, 3};
    for (int i = 0; i < 200; ++i) tiny.add(compute_cid(std::to_string(i)));

    auto reply = hub->handshake(HandshakeRequest{
        .client_id = "c", .session_id = "s1", .protocol_version = "v1",
        .bloom_filter = tiny.to_bytes()});
    EXPECT_TRUE(reply.full_resync_recommended);
}

TEST_F(SyncHubTest, handshake_rejects_bad_filter_and_version) {
    auto hub = make_hub();
    EXPECT_THROW(hub->handshake(HandshakeRequest{.client_id = "c", .session_id = "s1",
                                                 .protocol_version = "v1",
                                                 .bloom_filter = bytes_of("junk")}),
                 MalformedPayloadError);
    EXPECT_THROW(hub->handshake(HandshakeRequest{.client_id = "c", .session_id = "s2",
                                                 .protocol_version = "v2",
                                                 .bloom_filter = filter_of({})}),
                 InvalidSessionStateError);
    EXPECT_EQ(metrics->snapshot().errors_by_kind[ErrorKind::malformed_payload], 1u);
}

TEST_F(SyncHubTest, parallel_scan_finds_every_missing_object) {
    auto all = std::vector<Cid>{};
    for (int i = 0; i < 9000; ++i) all.push_back(objects->put(bytes_of("obj-" + std::to_string(i))));
    auto client_has = std::vector<Cid>(all.begin(), all.begin() + 4500);

    auto hub = std::make_unique<SyncHub>(config, HubServices{
        .objects = objects,
        .entries = entries,
        .executor = std::make_shared<tf::Executor>(4),
    });
    auto reply = hub->handshake(HandshakeRequest{.client_id = "c", .session_id = "s1",
                                                 .protocol_version = "v1",
                                                 .bloom_filter = filter_of(client_has)});

    // Bloom false positives can only hide objects, never invent them
    EXPECT_LE(reply.missing_cids.size(), 4500u);
    EXPECT_GT(reply.missing_cids.size(), 4400u);
    for (const auto& c : reply.missing_cids) {
        EXPECT_EQ(std::ranges::find(client_has, c), client_has.end());
    }
}

// -- Commit -------------------------------------------------------------------

TEST_F(SyncHubTest, inline_commit_applies_and_replays) {
    auto hub = make_hub();
    open(*hub, "s1");
    auto payload = payload_of({
        serialize_entry_delta(entry("u1", "齿轮"), DeltaOperation::create),
        serialize_entry_delta(entry("u2", "轴"), DeltaOperation::create),
    });

    auto first = hub->commit(commit_request("s1", payload));
    EXPECT_TRUE(first.applied);
    EXPECT_FALSE(first.replayed);
    EXPECT_EQ(first.processed, 2u);
    EXPECT_EQ(first.created, 2u);
    EXPECT_EQ(first.committed_at, now);
    EXPECT_EQ(entries->get("u1")->entry->dst_text, "齿轮");
    EXPECT_TRUE(objects->contains(compute_cid(payload)));

    // A retried commit in a new session changes nothing
    open(*hub, "s2");
    auto again = hub->commit(commit_request("s2", payload));
    EXPECT_FALSE(again.applied);
    EXPECT_TRUE(again.replayed);
    EXPECT_EQ(again.session_id, "s2");
    EXPECT_EQ(again.created, 2u);
    EXPECT_EQ(again.committed_at, first.committed_at);
    EXPECT_EQ(entries->get("u1")->revision, 1u);
    EXPECT_EQ(hub->session_status("s2").stats.payloads_replayed, 1u);
}

TEST_F(SyncHubTest, conflicting_commit_replays_the_same_conflicts) {
    auto hub = make_hub();
    open(*hub, "s1");
    hub->commit(commit_request("s1", payload_of({serialize_entry_delta(entry("u1", "一"),
                                                                       DeltaOperation::create)})));

    // Based on a version the hub never saw
    auto payload = payload_of({serialize_entry_delta(entry("u1", "二"), DeltaOperation::update,
                                                     compute_cid("gone"))});
    auto first = hub->commit(commit_request("s1", payload));
    EXPECT_TRUE(first.applied);
    EXPECT_EQ(first.conflict_count, 1u);
    auto revision = entries->get("u1")->revision;

    auto again = hub->commit(commit_request("s1", payload));
    EXPECT_TRUE(again.replayed);
    EXPECT_FALSE(again.applied);
    EXPECT_EQ(again.conflict_count, 1u);
    ASSERT_EQ(again.conflicts.size(), 1u);
    EXPECT_EQ(again.conflicts[0].uid, "u1");
    EXPECT_EQ(entries->get("u1")->revision, revision);
    EXPECT_EQ(entries->get("u1")->entry->dst_text, "一");
}

TEST_F(SyncHubTest, session_expiring_mid_commit_writes_nothing) {
    auto hooked = std::make_shared<HookedEntryStore>();
    entries = hooked;
    auto hub = make_hub();
    open(*hub, "s1");
    hooked->on_lookup = [this] { now = now + 11min; };

    auto payload = payload_of({serialize_entry_delta(entry("u1", "迟到"), DeltaOperation::create)});
    EXPECT_THROW(hub->commit(commit_request("s1", payload)), SessionExpiredError);

    hooked->on_lookup = nullptr;
    EXPECT_FALSE(entries->get("u1").has_value());
    EXPECT_FALSE(entries->committed_payload(compute_cid(payload)).has_value());
    EXPECT_EQ(hub->session_status("s1").status, SessionStatus::expired);
}

TEST_F(SyncHubTest, chunked_upload_then_commit) {
    auto hub = make_hub();
    open(*hub, "s1");
    auto deltas = std::vector<EntryDelta>{};
    for (int i = 0; i < 10; ++i) {
        deltas.push_back(serialize_entry_delta(entry("u" + std::to_string(i), "零件"),
                                               DeltaOperation::create));
    }
    auto payload = payload_of(deltas);
    auto chunks = split_into_chunks("s1", payload, 64);
    ASSERT_GT(chunks.size(), 2u);

    auto last = ChunkAck{};
    for (const auto& c : chunks) {
        last = hub->upload_chunk(c);
        EXPECT_TRUE(last.accepted);
    }
    EXPECT_TRUE(last.object_complete);
    EXPECT_TRUE(objects->contains(compute_cid(payload)));

    auto request = commit_request("s1", payload);
    request.payload.reset();
    auto response = hub->commit(request);
    EXPECT_EQ(response.created, 10u);

    auto status = hub->complete_session("s1");
    EXPECT_EQ(status.status, SessionStatus::completed);
    EXPECT_EQ(status.stats.chunks_received, chunks.size());
    EXPECT_EQ(status.stats.objects_received, 1u);
    EXPECT_EQ(status.stats.payloads_committed, 1u);
}

TEST_F(SyncHubTest, corrupted_chunk_is_rejected_and_resent) {
    auto hub = make_hub();
    open(*hub, "s1");
    auto object = std::vector<std::byte>(200, std::byte{0x5A});
    auto chunks = split_into_chunks("s1", object, 64);

    hub->upload_chunk(chunks[0]);
    auto bad = chunks[1];
    bad.data[3] = std::byte{0x00};
    auto ack = hub->upload_chunk(bad);

    EXPECT_FALSE(ack.accepted);
    ASSERT_TRUE(ack.error.has_value());
    EXPECT_EQ(ack.next_chunk_index, 1u);
    EXPECT_EQ(hub->session_status("s1").status, SessionStatus::active);
    EXPECT_EQ(hub->session_status("s1").stats.chunks_rejected, 1u);

    for (std::size_t i = 1; i < chunks.size(); ++i) ack = hub->upload_chunk(chunks[i]);
    EXPECT_TRUE(ack.object_complete);
    EXPECT_EQ(*objects->get(compute_cid(object)), object);
}

TEST_F(SyncHubTest, oversized_chunk_is_rejected) {
    auto hub = make_hub();
    open(*hub, "s1");
    auto object = std::vector<std::byte>(300, std::byte{0x11});
    auto big = split_into_chunks("s1", object, 128);

    auto ack = hub->upload_chunk(big[0]);
    EXPECT_FALSE(ack.accepted);
    ASSERT_TRUE(ack.error.has_value());
    EXPECT_NE(ack.error->find("chunk size"), std::string::npos);
    EXPECT_FALSE(ack.object_complete);
    EXPECT_EQ(hub->session_status("s1").stats.chunks_rejected, 1u);
    EXPECT_EQ(hub->session_status("s1").stats.bytes_received, 0u);
    EXPECT_EQ(hub->session_status("s1").status, SessionStatus::active);

    // The same object in session-sized chunks goes through
    for (const auto& c : split_into_chunks("s1", object, 64)) ack = hub->upload_chunk(c);
    EXPECT_TRUE(ack.object_complete);
}

TEST_F(SyncHubTest, upload_bounds_cap_object_and_buffer_size) {
    config.max_object_size = 1000;
    config.max_session_buffer_bytes = 256;
    auto hub = make_hub();
    open(*hub, "s1");

    auto huge = std::vector<std::byte>(1001, std::byte{0x22});
    auto ack = hub->upload_chunk(split_into_chunks("s1", huge, 64)[0]);
    EXPECT_FALSE(ack.accepted);
    EXPECT_NE(ack.error->find("max_object_size"), std::string::npos);

    // Four partial objects fill the buffer, the fifth is refused
    for (int i = 0; i < 4; ++i) {
        auto object = std::vector<std::byte>(200, static_cast<std::byte>(i));
        EXPECT_TRUE(hub->upload_chunk(split_into_chunks("s1", object, 64)[0]).accepted);
    }
    auto fifth = std::vector<std::byte>(200, std::byte{0x7F});
    ack = hub->upload_chunk(split_into_chunks("s1", fifth, 64)[0]);
    EXPECT_FALSE(ack.accepted);
    EXPECT_NE(ack.error->find("buffer"), std::string::npos);
    EXPECT_EQ(hub->session_status("s1").stats.chunks_rejected, 2u);
    EXPECT_EQ(metrics->snapshot().chunks_rejected, 2u);
}

TEST_F(SyncHubTest, malformed_payload_leaves_session_active) {
    auto hub = make_hub();
    open(*hub, "s1");
    auto junk = bytes_of("definitely not a payload");
    try {
        hub->commit(commit_request("s1", junk));
        FAIL() << "expected MalformedPayloadError";
    } catch (const MalformedPayloadError& e) {
        EXPECT_EQ(e.context().session_id, "s1");
        EXPECT_EQ(e.context().cid, to_string(compute_cid(junk)));
    }
    EXPECT_EQ(hub->session_status("s1").status, SessionStatus::active);
    EXPECT_EQ(entries->payload_record_count(), 0u);
}

TEST_F(SyncHubTest, payload_must_match_its_cid_and_exist) {
    auto hub = make_hub();
    open(*hub, "s1");
    auto payload = payload_of({serialize_entry_delta(entry("u1", "x"), DeltaOperation::create)});

    auto wrong = commit_request("s1", payload);
    wrong.payload_cid = compute_cid("something else");
    EXPECT_THROW(hub->commit(wrong), IntegrityError);

    auto missing = commit_request("s1", payload);
    missing.payload.reset();
    EXPECT_THROW(hub->commit(missing), ObjectNotFoundError);
}

TEST_F(SyncHubTest, exhausted_commit_retries_fail_the_session) {
    auto stale = std::make_shared<StaleEntryStore>();
    auto hub = SyncHub{config, HubServices{.objects = objects, .entries = stale,
                                           .clock = [this] { return now; }}};
    hub.handshake(HandshakeRequest{.client_id = "c", .session_id = "s1",
                                   .protocol_version = "v1", .bloom_filter = filter_of({})});

    auto payload = payload_of({serialize_entry_delta(entry("u1", "x"), DeltaOperation::create)});
    EXPECT_THROW(hub.commit(commit_request("s1", payload)), ConcurrentCommitError);
    EXPECT_EQ(hub.session_status("s1").status, SessionStatus::failed);
}

TEST_F(SyncHubTest, registered_override_locks_fields) {
    auto hub = make_hub();
    auto processor = OverrideChainProcessor{};
    hub->register_override(
        processor.create_manual_override("item.create.u1", "zh_cn", "人工译文", "alice"));
    open(*hub, "s1");

    auto payload = payload_of({serialize_entry_delta(entry("u1", "机翻"), DeltaOperation::create)});
    hub->commit(commit_request("s1", payload));
    EXPECT_EQ(entries->get("u1")->entry->dst_text, "人工译文");
    EXPECT_TRUE(hub->validate_overrides().empty());
    EXPECT_EQ(hub->statistics().overrides, 1u);
}

// -- Download -----------------------------------------------------------------

TEST_F(SyncHubTest, download_serves_stored_objects) {
    auto object = std::vector<std::byte>(150, std::byte{0x11});
    auto cid = objects->put(object);
    auto hub = make_hub();
    open(*hub, "s1");

    auto chunk = hub->download_chunk(ChunkRequest{.session_id = "s1", .cid = cid, .chunk_index = 2});
    EXPECT_EQ(chunk.total_chunks, 3u);
    EXPECT_EQ(chunk.data.size(), 22u);
    EXPECT_TRUE(verify_cid(chunk.data, chunk.chunk_hash));

    EXPECT_THROW(hub->download_chunk(ChunkRequest{.session_id = "s1", .cid = compute_cid("nope"),
                                                  .chunk_index = 0}),
                 ObjectNotFoundError);
    EXPECT_THROW(hub->download_chunk(ChunkRequest{.session_id = "s1", .cid = cid, .chunk_index = 3}),
                 std::out_of_range);
}

// -- Lifecycle ----------------------------------------------------------------

TEST_F(SyncHubTest, expired_session_refuses_work) {
    auto hub = make_hub();
    open(*hub, "s1");
    now = now + 10min;

    auto chunks = split_into_chunks("s1", bytes_of("late"), 64);
    EXPECT_THROW(hub->upload_chunk(chunks[0]), SessionExpiredError);
    EXPECT_EQ(hub->session_status("s1").status, SessionStatus::expired);
    EXPECT_EQ(metrics->snapshot().sessions_by_outcome[SessionStatus::expired], 1u);
}

TEST_F(SyncHubTest, sweep_and_cancel) {
    auto hub = make_hub();
    open(*hub, "old");
    now = now + 9min;
    open(*hub, "young");
    now = now + 2min;

    EXPECT_EQ(hub->sweep_expired_sessions(), std::vector<std::string>{"old"});
    EXPECT_EQ(hub->cancel_session("young").status, SessionStatus::cancelled);
    EXPECT_EQ(hub->statistics().live_sessions, 0u);
    EXPECT_THROW(hub->session_status("never"), SessionNotFoundError);
}

TEST_F(SyncHubTest, cancel_keeps_finished_objects_and_stops_the_session) {
    auto hub = make_hub();
    open(*hub, "s1");
    auto done = std::vector<std::byte>(150, std::byte{0x31});
    auto partial = std::vector<std::byte>(150, std::byte{0x32});
    for (const auto& c : split_into_chunks("s1", done, 64)) hub->upload_chunk(c);
    auto rest = split_into_chunks("s1", partial, 64);
    hub->upload_chunk(rest[0]);

    auto status = hub->cancel_session("s1");
    EXPECT_EQ(status.status, SessionStatus::cancelled);
    EXPECT_EQ(*objects->get(compute_cid(done)), done);
    EXPECT_FALSE(objects->contains(compute_cid(partial)));

    EXPECT_THROW(hub->upload_chunk(rest[1]), InvalidSessionStateError);
    auto payload = payload_of({serialize_entry_delta(entry("u1", "取消"), DeltaOperation::create)});
    EXPECT_THROW(hub->commit(commit_request("s1", payload)), InvalidSessionStateError);
    EXPECT_FALSE(entries->get("u1").has_value());
    EXPECT_THROW(hub->cancel_session("s1"), SessionNotFoundError);
}

// -- Maintenance --------------------------------------------------------------

TEST_F(SyncHubTest, compaction_drops_old_records_under_lock) {
    auto hub = make_hub();
    open(*hub, "s1");
    hub->commit(commit_request("s1", payload_of({serialize_entry_delta(entry("u1", "x"),
                                                                       DeltaOperation::create)})));
    now = now + 30min;
    open(*hub, "s2");
    hub->commit(commit_request("s2", payload_of({serialize_entry_delta(entry("u2", "y"),
                                                                       DeltaOperation::create)})));

    now = now + 45min;
    EXPECT_EQ(hub->compact_idempotency_log(), 1u);
    EXPECT_EQ(entries->payload_record_count(), 1u);

    hub->lock_manager().try_acquire("idempotency-log", "other-worker", 1min);
    EXPECT_THROW(hub->compact_idempotency_log("worker"), ResourceBusyError);
}

// -- Async --------------------------------------------------------------------

TEST_F(SyncHubTest, async_calls_run_on_the_pool) {
    auto hub = SyncHub{config, HubServices{.objects = objects, .entries = entries,
                                           .pool = std::make_shared<thread_pool>(2)}};
    hub.handshake(HandshakeRequest{.client_id = "c", .session_id = "s1",
                                   .protocol_version = "v1", .bloom_filter = filter_of({})});

    auto object = std::vector<std::byte>(100, std::byte{0x22});
    auto futures = std::vector<std::future<ChunkAck>>{};
    for (auto& c : split_into_chunks("s1", object, 64)) futures.push_back(hub.async_upload_chunk(c));
    for (auto& f : futures) EXPECT_TRUE(f.get().accepted);
    EXPECT_TRUE(objects->contains(compute_cid(object)));

    auto payload = payload_of({serialize_entry_delta(entry("u1", "x"), DeltaOperation::create)});
    EXPECT_EQ(hub.async_commit(commit_request("s1", payload)).get().created, 1u);

    auto bad = commit_request("s1", bytes_of("junk"));
    auto failed = hub.async_commit(bad);
    EXPECT_THROW(failed.get(), MalformedPayloadError);
}
