// offline_outbox_demo: edits made while the hub is unreachable survive on
// disk and are pushed once it comes back
//
// Demonstrates: FileOutboxStore, SyncTransport, retry after TransportError

#include <l10n-sync/l10n_sync.hpp>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

namespace ls = l10n_sync;

// A transport whose link can be switched off.
class FlakyLink : public ls::SyncTransport {
public:
    explicit FlakyLink(ls::SyncHub& hub) : inner_{hub} {}

    auto handshake(const ls::HandshakeRequest& r) -> ls::HandshakeResponse override {
        check();
        return inner_.handshake(r);
    }
    auto upload_chunk(const ls::ChunkMessage& c) -> ls::ChunkAck override {
        check();
        return inner_.upload_chunk(c);
    }
    auto download_chunk(const ls::ChunkRequest& r) -> ls::ChunkMessage override {
        check();
        return inner_.download_chunk(r);
    }
    auto commit(const ls::CommitRequest& r) -> ls::CommitResponse override {
        check();
        return inner_.commit(r);
    }
    auto complete_session(std::string_view id) -> ls::SessionStatusResponse override {
        check();
        return inner_.complete_session(id);
    }
    auto cancel_session(std::string_view id) -> ls::SessionStatusResponse override {
        check();
        return inner_.cancel_session(id);
    }

    bool online{true};

private:
    void check() const {
        if (!online) throw ls::TransportError{"hub unreachable"};
    }

    ls::LocalTransport inner_;
};

static auto make_client(const ls::SyncConfig& config, const std::filesystem::path& outbox,
                        std::shared_ptr<ls::SyncTransport> link) -> std::unique_ptr<ls::SyncClient> {
    return std::make_unique<ls::SyncClient>("translator-1", config, ls::ClientServices{
        .objects = std::make_shared<ls::InMemoryObjectStore>(),
        .entries = std::make_shared<ls::InMemoryEntryStore>(),
        .outbox = std::make_shared<ls::FileOutboxStore>(outbox),
        .transport = std::move(link),
    });
}

int main() {
    auto config = ls::SyncConfig{};
    auto hub_entries = std::make_shared<ls::InMemoryEntryStore>();
    auto hub = ls::SyncHub{config, ls::HubServices{
        .objects = std::make_shared<ls::InMemoryObjectStore>(),
        .entries = hub_entries,
    }};

    auto outbox = std::filesystem::temp_directory_path() / "l10n_sync_outbox_demo.jsonl";
    std::filesystem::remove(outbox);

    auto link = std::make_shared<FlakyLink>(hub);
    link->online = false;

    {
        auto client = make_client(config, outbox, link);
        for (const auto* key : {"copper_ingot", "copper_nugget", "copper_sheet"}) {
            auto e = ls::TranslationEntry{};
            e.uid = key;
            e.key = std::string{"item.create."} + key;
            e.locale = "zh_cn";
            e.dst_text = "铜";
            e.status = ls::EntryStatus::in_progress;
            client->record_local_edit(e, ls::DeltaOperation::create);
        }
        auto report = client->sync();
        std::printf("offline sync: completed=%d error=\"%s\" queued=%zu\n", report.completed,
                    report.error ? report.error->message.c_str() : "", report.outbox_remaining);
    }

    // The process restarts; the queue is read back from disk
    link->online = true;
    auto client = make_client(config, outbox, link);
    std::printf("after restart: %zu changes pending\n", client->pending_changes());

    auto report = client->sync();
    std::printf("online sync:  completed=%d pushed=%zu remaining=%zu\n", report.completed,
                report.deltas_pushed, report.outbox_remaining);
    std::printf("hub now holds %zu entries\n", hub_entries->live_entries().size());

    std::filesystem::remove(outbox);
    return 0;
}
