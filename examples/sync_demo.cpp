// sync_demo: two clients syncing translations through one hub
//
// Demonstrates: SyncHub, SyncClient, LocalTransport, SyncReport,
//               conflict detection across clients

#include <l10n-sync/l10n_sync.hpp>

#include <cstdio>
#include <memory>
#include <string>
#include <utility>

namespace ls = l10n_sync;

struct Peer {
    std::shared_ptr<ls::InMemoryObjectStore> objects = std::make_shared<ls::InMemoryObjectStore>();
    std::shared_ptr<ls::InMemoryEntryStore> entries = std::make_shared<ls::InMemoryEntryStore>();
    std::unique_ptr<ls::SyncClient> client;

    Peer(std::string id, const ls::SyncConfig& config, ls::SyncHub& hub) {
        client = std::make_unique<ls::SyncClient>(std::move(id), config, ls::ClientServices{
            .objects = objects,
            .entries = entries,
            .outbox = std::make_shared<ls::InMemoryOutboxStore>(),
            .transport = std::make_shared<ls::LocalTransport>(hub),
        });
    }

    auto show(const char* uid) const -> void {
        auto stored = entries->get(uid);
        if (!stored || !stored->entry) {
            std::printf("  %-10s %s: <none>\n", client->client_id().c_str(), uid);
            return;
        }
        std::printf("  %-10s %s: \"%s\" [%s]\n", client->client_id().c_str(), uid,
                    stored->entry->dst_text.c_str(),
                    std::string{ls::to_string_view(stored->entry->status)}.c_str());
    }
};

static auto entry(const char* uid, const char* dst) -> ls::TranslationEntry {
    auto e = ls::TranslationEntry{};
    e.uid = uid;
    e.key = std::string{"item.create."} + uid;
    e.locale = "zh_cn";
    e.dst_text = dst;
    e.status = ls::EntryStatus::translated;
    return e;
}

static void print_report(const char* who, const ls::SyncReport& r) {
    std::printf("%s: completed=%d pushed=%zu deltas, applied=%zu payloads, conflicts=%zu\n",
                who, r.completed, r.deltas_pushed, r.payloads_applied, r.local_conflicts);
    if (r.error) std::printf("  error: %s\n", r.error->message.c_str());
}

int main() {
    auto config = ls::SyncConfig{};
    config.chunk_size = 256;
    ls::configure_logging(config);

    auto metrics = std::make_shared<ls::MetricsCollector>();
    auto hub = ls::SyncHub{config, ls::HubServices{
        .objects = std::make_shared<ls::InMemoryObjectStore>(),
        .entries = std::make_shared<ls::InMemoryEntryStore>(),
        .metrics = metrics,
    }};

    auto alice = Peer{"alice", config, hub};
    auto bob = Peer{"bob", config, hub};

    // --- Scenario 1: one-way propagation ---
    std::printf("=== Scenario 1: one-way propagation ===\n");
    alice.client->record_local_edit(entry("brass_ingot", "黄铜锭"), ls::DeltaOperation::create);
    alice.client->record_local_edit(entry("zinc_ingot", "锌锭"), ls::DeltaOperation::create);
    print_report("alice", alice.client->sync());
    print_report("bob", bob.client->sync());
    bob.show("brass_ingot");
    bob.show("zinc_ingot");

    // --- Scenario 2: disjoint edits ---
    std::printf("\n=== Scenario 2: disjoint edits ===\n");
    bob.client->record_local_edit(entry("zinc_ingot", "锌块"), ls::DeltaOperation::update);
    alice.client->record_local_edit(entry("brass_ingot", "黄铜锭"), ls::DeltaOperation::del);
    print_report("bob", bob.client->sync());
    print_report("alice", alice.client->sync());
    print_report("bob", bob.client->sync());
    alice.show("zinc_ingot");
    bob.show("brass_ingot");

    // --- Scenario 3: concurrent edits of the same field ---
    std::printf("\n=== Scenario 3: concurrent edits ===\n");
    alice.client->record_local_edit(entry("zinc_ingot", "锌锭(甲)"), ls::DeltaOperation::update);
    bob.client->record_local_edit(entry("zinc_ingot", "锌锭(乙)"), ls::DeltaOperation::update);
    print_report("alice", alice.client->sync());
    print_report("bob", bob.client->sync());
    alice.show("zinc_ingot");
    bob.show("zinc_ingot");

    auto stats = hub.statistics();
    std::printf("\nhub: %zu objects, %zu payload records, %zu sessions archived\n",
                stats.objects, stats.payload_records, stats.archived_sessions);
    std::printf("%s\n", ls::snapshot_to_json(metrics->snapshot()).dump(2).c_str());
    return 0;
}
