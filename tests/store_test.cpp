#include <l10n-sync/content_address.hpp>
#include <l10n-sync/error.hpp>
#include <l10n-sync/file_outbox.hpp>
#include <l10n-sync/memory_store.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <vector>

using namespace l10n_sync;

namespace {

auto bytes_of(std::string_view s) -> std::vector<std::byte> {
    auto p = reinterpret_cast<const std::byte*>(s.data());
    return {p, p + s.size()};
}

auto entry(std::string uid, std::string dst) -> TranslationEntry {
    auto e = TranslationEntry{};
    e.uid = std::move(uid);
    e.uida_hash = "hash-" + e.uid;
    e.key = "item.test." + e.uid;
    e.locale = "zh_cn";
    e.src_text = "Test";
    e.dst_text = std::move(dst);
    e.status = EntryStatus::translated;
    return e;
}

auto record(const Cid& cid, Timestamp at) -> PayloadRecord {
    return PayloadRecord{.payload_cid = cid, .session_id = "s1", .committed_at = at,
                         .response = nlohmann::json{{"applied", true}}};
}

class FileOutboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("l10n_sync_outbox_" + std::to_string(
                    std::hash<std::string>{}(::testing::UnitTest::GetInstance()
                                                 ->current_test_info()->name())));
        std::filesystem::create_directories(dir_);
        path_ = dir_ / "outbox.jsonl";
        std::filesystem::remove(path_);
    }

    void TearDown() override {
        auto ec = std::error_code{};
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    std::filesystem::path path_;
};

}  // namespace

// -- InMemoryObjectStore ------------------------------------------------------

TEST(InMemoryObjectStore, put_returns_content_cid_and_deduplicates) {
    auto store = InMemoryObjectStore{};
    auto a = store.put(bytes_of("payload"));
    auto b = store.put(bytes_of("payload"));

    EXPECT_EQ(a, b);
    EXPECT_EQ(a, compute_cid("payload"));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.size_bytes(), 7u);
    ASSERT_NE(store.get(a), nullptr);
    EXPECT_EQ(*store.get(a), bytes_of("payload"));
}

TEST(InMemoryObjectStore, put_with_wrong_cid_throws) {
    auto store = InMemoryObjectStore{};
    EXPECT_THROW(store.put(compute_cid("other"), bytes_of("payload")), IntegrityError);
    EXPECT_EQ(store.size(), 0u);
}

TEST(InMemoryObjectStore, list_is_sorted_and_get_missing_is_null) {
    auto store = InMemoryObjectStore{};
    for (auto s : {"c", "a", "b"}) store.put(bytes_of(s));

    auto cids = store.list();
    ASSERT_EQ(cids.size(), 3u);
    EXPECT_TRUE(std::is_sorted(cids.begin(), cids.end()));
    EXPECT_EQ(store.get(compute_cid("zzz")), nullptr);
    EXPECT_FALSE(store.contains(compute_cid("zzz")));
}

// -- InMemoryEntryStore -------------------------------------------------------

TEST(InMemoryEntryStore, commit_bumps_revision_and_tracks_version) {
    auto store = InMemoryEntryStore{};
    auto e = entry("u1", "一");
    auto write = EntryWrite{.uid = "u1", .entry = e, .expected_revision = 0};
    EXPECT_EQ(store.commit_batch(std::span{&write, 1}, std::nullopt), CommitOutcome::committed);

    auto stored = store.get("u1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->revision, 1u);
    EXPECT_EQ(stored->entry, e);
    EXPECT_EQ(stored->version_cid, entry_version_cid(e));
    EXPECT_FALSE(stored->last_payload_cid.has_value());
}

TEST(InMemoryEntryStore, stale_revision_rejects_the_whole_batch) {
    auto store = InMemoryEntryStore{};
    auto first = EntryWrite{.uid = "u1", .entry = entry("u1", "一"), .expected_revision = 0};
    store.commit_batch(std::span{&first, 1}, std::nullopt);

    auto writes = std::vector<EntryWrite>{
        {.uid = "u2", .entry = entry("u2", "二"), .expected_revision = 0},
        {.uid = "u1", .entry = entry("u1", "壹"), .expected_revision = 0},
    };
    auto cid = compute_cid("payload");
    EXPECT_THROW(store.commit_batch(writes, record(cid, Timestamp{1})), ConcurrentCommitError);

    EXPECT_FALSE(store.get("u2").has_value());
    EXPECT_EQ(store.get("u1")->entry->dst_text, "一");
    EXPECT_FALSE(store.committed_payload(cid).has_value());
}

TEST(InMemoryEntryStore, duplicate_uid_in_batch_is_rejected) {
    auto store = InMemoryEntryStore{};
    auto writes = std::vector<EntryWrite>{
        {.uid = "u1", .entry = entry("u1", "一"), .expected_revision = 0},
        {.uid = "u1", .entry = entry("u1", "二"), .expected_revision = 0},
    };
    EXPECT_THROW(store.commit_batch(writes, std::nullopt), ConcurrentCommitError);
}

TEST(InMemoryEntryStore, tombstone_keeps_revision_and_hides_from_live_entries) {
    auto store = InMemoryEntryStore{};
    auto create = EntryWrite{.uid = "u1", .entry = entry("u1", "一"), .expected_revision = 0};
    store.commit_batch(std::span{&create, 1}, std::nullopt);
    auto remove = EntryWrite{.uid = "u1", .entry = std::nullopt, .expected_revision = 1};
    store.commit_batch(std::span{&remove, 1}, std::nullopt);

    auto stored = store.get("u1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->is_deleted());
    EXPECT_EQ(stored->revision, 2u);
    EXPECT_FALSE(stored->version_cid.has_value());
    EXPECT_TRUE(store.live_entries().empty());

    // Recreating must name the tombstone's revision
    auto recreate = EntryWrite{.uid = "u1", .entry = entry("u1", "新"), .expected_revision = 0};
    EXPECT_THROW(store.commit_batch(std::span{&recreate, 1}, std::nullopt), ConcurrentCommitError);
    recreate.expected_revision = 2;
    EXPECT_EQ(store.commit_batch(std::span{&recreate, 1}, std::nullopt), CommitOutcome::committed);
}

TEST(InMemoryEntryStore, payload_record_makes_commit_idempotent) {
    auto store = InMemoryEntryStore{};
    auto cid = compute_cid("payload");
    auto write = EntryWrite{.uid = "u1", .entry = entry("u1", "一"), .expected_revision = 0};

    EXPECT_EQ(store.commit_batch(std::span{&write, 1}, record(cid, Timestamp{1})),
              CommitOutcome::committed);
    EXPECT_EQ(store.commit_batch(std::span{&write, 1}, record(cid, Timestamp{2})),
              CommitOutcome::already_committed);

    EXPECT_EQ(store.get("u1")->revision, 1u);
    EXPECT_EQ(store.get("u1")->last_payload_cid, cid);
    auto rec = store.committed_payload(cid);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->committed_at, Timestamp{1});
    EXPECT_EQ(rec->response["applied"], true);
}

TEST(InMemoryEntryStore, prune_drops_old_records_only) {
    auto store = InMemoryEntryStore{};
    store.commit_batch({}, record(compute_cid("old"), Timestamp{10}));
    store.commit_batch({}, record(compute_cid("new"), Timestamp{100}));

    EXPECT_EQ(store.prune_payload_records(Timestamp{50}), 1u);
    EXPECT_EQ(store.payload_record_count(), 1u);
    EXPECT_TRUE(store.committed_payload(compute_cid("new")).has_value());
}

TEST(InMemoryEntryStore, find_by_uida_hash) {
    auto store = InMemoryEntryStore{};
    auto writes = std::vector<EntryWrite>{
        {.uid = "u1", .entry = entry("u1", "一"), .expected_revision = 0},
        {.uid = "u2", .entry = entry("u2", "二"), .expected_revision = 0},
    };
    store.commit_batch(writes, std::nullopt);
    auto found = store.find_by_uida_hash("hash-u2");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].uid, "u2");
}

TEST(InMemoryEntryStore, concurrent_writers_to_one_uid_serialize) {
    auto store = InMemoryEntryStore{};
    auto seed = EntryWrite{.uid = "u1", .entry = entry("u1", "0"), .expected_revision = 0};
    store.commit_batch(std::span{&seed, 1}, std::nullopt);

    auto successes = std::atomic<int>{0};
    auto threads = std::vector<std::thread>{};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t] {
            auto w = EntryWrite{.uid = "u1", .entry = entry("u1", std::to_string(t)),
                                .expected_revision = 1};
            try {
                store.commit_batch(std::span{&w, 1}, std::nullopt);
                ++successes;
            } catch (const ConcurrentCommitError&) {
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(store.get("u1")->revision, 2u);
}

// -- InMemoryOutboxStore ------------------------------------------------------

TEST(InMemoryOutboxStore, fifo_per_client) {
    auto outbox = InMemoryOutboxStore{};
    auto s1 = outbox.append("a", serialize_entry_delta(entry("u1", "一"), DeltaOperation::create), Timestamp{1});
    auto s2 = outbox.append("b", serialize_entry_delta(entry("u2", "二"), DeltaOperation::create), Timestamp{2});
    auto s3 = outbox.append("a", serialize_entry_delta(entry("u3", "三"), DeltaOperation::update), Timestamp{3});

    EXPECT_LT(s1, s2);
    EXPECT_LT(s2, s3);
    auto pending = outbox.pending("a", 10);
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].sequence, s1);
    EXPECT_EQ(pending[1].sequence, s3);
    EXPECT_EQ(outbox.pending("a", 1).size(), 1u);
    EXPECT_EQ(outbox.size(), 3u);
    EXPECT_EQ(outbox.size("b"), 1u);

    auto done = std::vector<std::uint64_t>{s1, 999};
    outbox.remove(done);
    EXPECT_EQ(outbox.size("a"), 1u);
    EXPECT_EQ(outbox.pending("a", 10)[0].sequence, s3);
}

// -- FileOutboxStore ----------------------------------------------------------

TEST_F(FileOutboxTest, survives_reopen) {
    auto delta = serialize_entry_delta(entry("u1", "钻石"), DeltaOperation::update, compute_cid("base"));
    delta.entry.qa_flags.issues = {"length"};
    auto seq = std::uint64_t{0};
    {
        auto outbox = FileOutboxStore{path_};
        seq = outbox.append("client", delta, Timestamp{77});
        outbox.append("client", serialize_entry_delta(entry("u2", "金"), DeltaOperation::del), Timestamp{78});
    }

    auto reopened = FileOutboxStore{path_};
    auto pending = reopened.pending("client", 10);
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].sequence, seq);
    EXPECT_EQ(pending[0].delta, delta);
    EXPECT_EQ(pending[0].created_at, Timestamp{77});
    EXPECT_TRUE(pending[1].delta.is_tombstone());

    // Sequence numbers keep increasing after a reopen
    auto next = reopened.append("client", delta, Timestamp{79});
    EXPECT_GT(next, pending[1].sequence);
}

TEST_F(FileOutboxTest, remove_is_persisted) {
    {
        auto outbox = FileOutboxStore{path_};
        auto s1 = outbox.append("c", serialize_entry_delta(entry("u1", "一"), DeltaOperation::create), Timestamp{1});
        outbox.append("c", serialize_entry_delta(entry("u2", "二"), DeltaOperation::create), Timestamp{2});
        auto done = std::vector<std::uint64_t>{s1};
        outbox.remove(done);
    }
    auto reopened = FileOutboxStore{path_};
    ASSERT_EQ(reopened.size(), 1u);
    EXPECT_EQ(reopened.pending("c", 10)[0].delta.entry.uid, "u2");
    EXPECT_FALSE(std::filesystem::exists(path_.string() + ".tmp"));
}

TEST_F(FileOutboxTest, bare_file_name_syncs_the_working_directory) {
    auto previous = std::filesystem::current_path();
    std::filesystem::current_path(dir_);
    {
        auto outbox = FileOutboxStore{"outbox.jsonl"};
        EXPECT_NO_THROW(outbox.append("c", serialize_entry_delta(entry("u1", "一"),
                                                                 DeltaOperation::create),
                                      Timestamp{1}));
    }
    std::filesystem::current_path(previous);
    EXPECT_EQ(FileOutboxStore{dir_ / "outbox.jsonl"}.size(), 1u);
}

TEST_F(FileOutboxTest, failed_persist_keeps_memory_state) {
    auto nested = dir_ / "nested";
    std::filesystem::create_directories(nested);
    auto outbox = FileOutboxStore{nested / "outbox.jsonl"};
    outbox.append("c", serialize_entry_delta(entry("u1", "一"), DeltaOperation::create), Timestamp{1});

    std::filesystem::remove_all(nested);
    EXPECT_THROW(outbox.append("c", serialize_entry_delta(entry("u2", "二"), DeltaOperation::create),
                               Timestamp{2}),
                 StorageError);
    EXPECT_EQ(outbox.size(), 1u);
    EXPECT_EQ(outbox.pending("c", 10)[0].delta.entry.uid, "u1");
}

TEST_F(FileOutboxTest, malformed_line_is_a_storage_error) {
    {
        auto out = std::ofstream{path_};
        out << "{\"sequence\": 1, \"client_id\": \"c\"\n";
    }
    EXPECT_THROW(FileOutboxStore{path_}, StorageError);
}

TEST_F(FileOutboxTest, missing_file_starts_empty) {
    auto outbox = FileOutboxStore{path_};
    EXPECT_EQ(outbox.size(), 0u);
    EXPECT_EQ(outbox.path(), path_);
}
