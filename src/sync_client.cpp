#include <l10n-sync/sync_client.hpp>

#include <l10n-sync/bloom_filter.hpp>
#include <l10n-sync/content_address.hpp>
#include <l10n-sync/delta_applier.hpp>
#include <l10n-sync/json.hpp>
#include <l10n-sync/sync_hub.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace l10n_sync {

// -- LocalTransport -----------------------------------------------------------

auto LocalTransport::handshake(const HandshakeRequest& request) -> HandshakeResponse {
    return hub_.handshake(request);
}

auto LocalTransport::upload_chunk(const ChunkMessage& chunk) -> ChunkAck {
    return hub_.upload_chunk(chunk);
}

auto LocalTransport::download_chunk(const ChunkRequest& request) -> ChunkMessage {
    return hub_.download_chunk(request);
}

auto LocalTransport::commit(const CommitRequest& request) -> CommitResponse {
    return hub_.commit(request);
}

auto LocalTransport::complete_session(std::string_view session_id) -> SessionStatusResponse {
    return hub_.complete_session(session_id);
}

auto LocalTransport::cancel_session(std::string_view session_id) -> SessionStatusResponse {
    return hub_.cancel_session(session_id);
}

// -- SyncClient ---------------------------------------------------------------

namespace {

// Thrown inside sync() when the caller requests a stop.
struct StopRequested {};

void check_stop(const std::stop_token& stop) {
    if (stop.stop_requested()) throw StopRequested{};
}

constexpr auto chunk_attempts = 2;

}  // namespace

SyncClient::SyncClient(std::string client_id, SyncConfig config, ClientServices services)
    : client_id_{std::move(client_id)},
      config_{std::move(config)},
      services_{std::move(services)},
      engine_{services_.clock} {
    config_.validate();
    if (client_id_.empty()) throw std::invalid_argument{"client id must not be empty"};
    if (!services_.objects || !services_.entries || !services_.outbox) {
        throw std::invalid_argument{"SyncClient needs object, entry and outbox stores"};
    }
    if (!services_.transport) throw std::invalid_argument{"SyncClient needs a transport"};
}

auto SyncClient::record_local_edit(const TranslationEntry& entry, DeltaOperation operation)
    -> std::uint64_t {
    auto stored = services_.entries->get(entry.uid);
    auto base = std::optional<Cid>{};
    if (stored && stored->entry) base = stored->version_cid;

    auto next = operation == DeltaOperation::del ? std::nullopt
                                                 : std::optional<TranslationEntry>{entry};
    if (next) services_.objects->put(entry_version_bytes(*next));

    auto write = EntryWrite{
        .uid = entry.uid,
        .entry = next,
        .expected_revision = stored ? stored->revision : 0,
    };
    // Queue first: an edit that cannot be queued must not be applied locally
    auto seq = services_.outbox->append(client_id_, serialize_entry_delta(entry, operation, base),
                                        services_.clock());
    try {
        services_.entries->commit_batch(std::span{&write, 1}, std::nullopt);
    } catch (...) {
        services_.outbox->remove(std::span{&seq, 1});
        throw;
    }
    SPDLOG_DEBUG("queued {} of {} as outbox #{}", to_string_view(operation), entry.uid, seq);
    return seq;
}

auto SyncClient::pending_changes() const -> std::size_t {
    return services_.outbox->size(client_id_);
}

auto SyncClient::next_session_id() -> std::string {
    return client_id_ + "-" + std::to_string(services_.clock().millis_since_epoch) + "-" +
           std::to_string(++session_counter_);
}

auto SyncClient::build_filter() const -> std::vector<std::byte> {
    auto cids = services_.objects->list();
    auto expected = std::max<std::uint64_t>(cids.size(), 1);
    // Headroom below the hub's bound so a full filter is still trusted
    auto filter = BloomFilter{optimal_bloom_parameters(expected, config_.max_false_positive_rate / 10)};
    for (const auto& cid : cids) filter.add(cid);
    return filter.to_bytes();
}

auto SyncClient::download_object(const std::string& session_id, const Cid& cid,
                                 std::stop_token stop) -> bool {
    if (services_.objects->contains(cid)) return false;

    auto assembler = ChunkAssembler{session_id};
    auto fetch = [&](std::uint32_t index) {
        for (auto attempt = 1;; ++attempt) {
            auto chunk = services_.transport->download_chunk(
                ChunkRequest{.session_id = session_id, .cid = cid, .chunk_index = index});
            try {
                return assembler.receive(chunk);
            } catch (const IntegrityError& e) {
                if (attempt >= chunk_attempts) throw;
                SPDLOG_WARN("chunk {} of {} failed verification, fetching again: {}",
                            index, to_string(cid), e.what());
            }
        }
    };

    auto progress = fetch(0);
    while (!progress.object_complete) {
        check_stop(stop);
        progress = fetch(*progress.next_chunk_index);
    }
    services_.objects->put(cid, assembler.take_object(cid));
    return true;
}

void SyncClient::apply_downloaded(const std::string& session_id, const std::vector<Cid>& cids,
                                  SyncReport& report) {
    struct Pending {
        Timestamp created_at;
        Cid cid;
        std::vector<EntryDelta> deltas;
    };
    auto payloads = std::vector<Pending>{};

    for (const auto& cid : cids) {
        auto bytes = services_.objects->get(cid);
        if (!bytes || !is_delta_payload(*bytes)) continue;
        if (services_.entries->committed_payload(cid)) continue;
        try {
            auto payload = decode_delta_payload(*bytes);
            payloads.push_back(Pending{payload.created_at, cid, std::move(payload.deltas)});
        } catch (const MalformedPayloadError& e) {
            SPDLOG_ERROR("downloaded payload {} is malformed, skipping: {}", to_string(cid), e.what());
            ++report.payloads_rejected;
        }
    }

    // Apply in the order the payloads were created on their senders
    std::ranges::sort(payloads, [](const Pending& a, const Pending& b) {
        return std::tie(a.created_at, a.cid) < std::tie(b.created_at, b.cid);
    });

    auto applier = DeltaApplier{*services_.entries, *services_.objects, engine_};
    auto options = ApplyOptions{.strategy = MergeStrategy::three_way,
                                .policy = ConflictPolicy::mark_for_review,
                                .max_retries = config_.max_commit_retries};
    for (const auto& p : payloads) {
        auto result = applier.apply(p.deltas, options, [&](const ApplyReport&) {
            return PayloadRecord{.payload_cid = p.cid,
                                 .session_id = session_id,
                                 .committed_at = services_.clock(),
                                 .response = nlohmann::json::object()};
        });
        ++report.payloads_applied;
        report.local_conflicts += result.conflicts.size();
    }
}

void SyncClient::push_outbox(const std::string& session_id, std::size_t chunk_size,
                             std::stop_token stop, SyncReport& report) {
    for (;;) {
        check_stop(stop);
        auto batch = services_.outbox->pending(client_id_, config_.outbox_batch_size);
        if (batch.empty()) return;

        auto deltas = std::vector<EntryDelta>{};
        auto sequences = std::vector<std::uint64_t>{};
        deltas.reserve(batch.size());
        for (const auto& e : batch) {
            deltas.push_back(e.delta);
            sequences.push_back(e.sequence);
        }

        // Stamped with the first entry's time so a re-sent batch keeps its Cid
        auto payload = create_delta_payload(deltas, batch.front().created_at);
        auto cid = calculate_payload_cid(payload);

        for (auto& chunk : split_into_chunks(session_id, payload, chunk_size)) {
            check_stop(stop);
            auto ack = services_.transport->upload_chunk(chunk);
            for (auto attempt = 1; !ack.accepted && attempt < chunk_attempts; ++attempt) {
                SPDLOG_WARN("hub rejected chunk {} of {}: {}", chunk.chunk_index, to_string(cid),
                            ack.error.value_or("no reason given"));
                ack = services_.transport->upload_chunk(chunk);
            }
            if (!ack.accepted) {
                throw IntegrityError{"hub rejected chunk: " + ack.error.value_or("no reason given"),
                                     ErrorContext{.session_id = session_id,
                                                  .cid = to_string(cid),
                                                  .chunk_index = chunk.chunk_index}};
            }
            if (ack.object_complete) break;
        }

        auto response = services_.transport->commit(CommitRequest{
            .session_id = session_id,
            .payload_cid = cid,
            .payload = std::nullopt,
            .merge_strategy = MergeStrategy::three_way,
            .conflict_policy = ConflictPolicy::mark_for_review,
        });

        // Confirmed: keep the payload so the next handshake does not fetch it back
        services_.objects->put(cid, std::move(payload));
        services_.entries->commit_batch({}, PayloadRecord{.payload_cid = cid,
                                                          .session_id = session_id,
                                                          .committed_at = services_.clock(),
                                                          .response = nlohmann::json(response)});
        services_.outbox->remove(sequences);

        ++report.payloads_pushed;
        report.deltas_pushed += deltas.size();
        SPDLOG_INFO("pushed {} outbox entries as {} ({} conflicts{})", deltas.size(),
                    to_string(cid), response.conflict_count, response.replayed ? ", replayed" : "");
        report.commits.push_back(std::move(response));
    }
}

auto SyncClient::sync(std::stop_token stop) -> SyncReport {
    auto report = SyncReport{};
    report.session_id = next_session_id();
    auto opened = false;

    try {
        check_stop(stop);
        auto hello = services_.transport->handshake(HandshakeRequest{
            .client_id = client_id_,
            .session_id = report.session_id,
            .protocol_version = config_.protocol_version,
            .bloom_filter = build_filter(),
        });
        opened = true;
        report.full_resync_recommended = hello.full_resync_recommended;

        for (const auto& cid : hello.missing_cids) {
            check_stop(stop);
            if (download_object(report.session_id, cid, stop)) ++report.objects_downloaded;
        }
        apply_downloaded(report.session_id, hello.missing_cids, report);

        push_outbox(report.session_id, std::min(hello.chunk_size, config_.max_chunk_size), stop,
                    report);

        check_stop(stop);
        services_.transport->complete_session(report.session_id);
        report.completed = true;
    } catch (const StopRequested&) {
        report.cancelled = true;
        SPDLOG_INFO("sync {} stopped on request", report.session_id);
    } catch (const SyncError& e) {
        SPDLOG_ERROR("sync {} failed: {}", report.session_id, e.what());
        report.error = e.error();
    } catch (const std::exception& e) {
        SPDLOG_ERROR("sync {} failed: {}", report.session_id, e.what());
        report.error = Error{ErrorKind::transport_error, e.what(),
                             ErrorContext{.session_id = report.session_id}};
    }

    if (opened && !report.completed) {
        try {
            services_.transport->cancel_session(report.session_id);
        } catch (const SyncError& e) {
            SPDLOG_DEBUG("session {} could not be cancelled: {}", report.session_id, e.what());
        }
    }

    report.outbox_remaining = services_.outbox->size(client_id_);
    return report;
}

}  // namespace l10n_sync
