#include <l10n-sync/chunk_transfer.hpp>

#include <l10n-sync/content_address.hpp>
#include <l10n-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace l10n_sync {

auto chunk_count(std::uint64_t object_size, std::size_t chunk_size) -> std::uint32_t {
    if (chunk_size == 0) throw std::invalid_argument{"chunk size must be positive"};
    if (object_size == 0) return 1;
    return static_cast<std::uint32_t>((object_size + chunk_size - 1) / chunk_size);
}

auto make_chunk(std::string_view session_id, const Cid& cid,
                std::span<const std::byte> object, std::uint32_t index,
                std::size_t chunk_size) -> ChunkMessage {
    const auto total = chunk_count(object.size(), chunk_size);
    if (index >= total) {
        throw std::out_of_range{"chunk index " + std::to_string(index) +
                                " out of range (" + std::to_string(total) + " chunks)"};
    }
    const auto begin = static_cast<std::size_t>(index) * chunk_size;
    const auto len = std::min(chunk_size, object.size() - std::min(begin, object.size()));
    auto slice = object.subspan(std::min(begin, object.size()), len);

    return ChunkMessage{
        .session_id = std::string{session_id},
        .cid = cid,
        .chunk_index = index,
        .total_chunks = total,
        .data = std::vector<std::byte>(slice.begin(), slice.end()),
        .chunk_hash = compute_cid(slice),
        .data_size = slice.size(),
        .object_size = object.size(),
    };
}

auto split_into_chunks(std::string_view session_id, std::span<const std::byte> object,
                       std::size_t chunk_size) -> std::vector<ChunkMessage> {
    const auto cid = compute_cid(object);
    const auto total = chunk_count(object.size(), chunk_size);
    auto result = std::vector<ChunkMessage>{};
    result.reserve(total);
    for (std::uint32_t i = 0; i < total; ++i) {
        result.push_back(make_chunk(session_id, cid, object, i, chunk_size));
    }
    return result;
}

// -- ChunkAssembler -----------------------------------------------------------

ChunkAssembler::ChunkAssembler(std::string session_id)
    : session_id_{std::move(session_id)} {}

auto ChunkAssembler::progress_of(const Cid& cid, const PartialObject& obj,
                                 std::uint32_t index, bool duplicate) const -> ChunkProgress {
    auto next = std::optional<std::uint32_t>{};
    for (std::uint32_t i = 0; i < obj.total_chunks; ++i) {
        if (!obj.chunks.contains(i)) { next = i; break; }
    }
    return ChunkProgress{
        .cid = cid,
        .chunk_index = index,
        .duplicate = duplicate,
        .object_complete = obj.chunks.size() == obj.total_chunks,
        .chunks_received = static_cast<std::uint32_t>(obj.chunks.size()),
        .total_chunks = obj.total_chunks,
        .bytes_received = obj.bytes,
        .object_size = obj.object_size,
        .next_chunk_index = next,
    };
}

auto ChunkAssembler::receive(const ChunkMessage& chunk) -> ChunkProgress {
    auto ctx = ErrorContext{
        .session_id = session_id_,
        .cid = to_string(chunk.cid),
        .chunk_index = chunk.chunk_index,
    };
    auto reject = [&](const std::string& why) {
        SPDLOG_WARN("rejected chunk {} of {} in session {}: {}",
                    chunk.chunk_index, ctx.cid, session_id_, why);
        throw IntegrityError{why, ctx};
    };

    if (chunk.session_id != session_id_) {
        reject("chunk addressed to session " + chunk.session_id);
    }
    if (chunk.total_chunks == 0) reject("total_chunks is zero");
    if (chunk.chunk_index >= chunk.total_chunks) reject("chunk index out of range");
    if (chunk.data.size() != chunk.data_size) reject("declared data size does not match data");
    if (chunk.data_size > chunk.object_size) reject("chunk larger than its object");
    if (!verify_cid(chunk.data, chunk.chunk_hash)) reject("chunk hash mismatch");

    auto it = objects_.find(chunk.cid);
    if (it != objects_.end()) {
        auto& obj = it->second;
        if (obj.total_chunks != chunk.total_chunks || obj.object_size != chunk.object_size) {
            reject("chunk count or object size differs from earlier chunks");
        }
        auto existing = obj.chunks.find(chunk.chunk_index);
        if (existing != obj.chunks.end()) {
            if (existing->second != chunk.data) reject("conflicting duplicate chunk");
            return progress_of(chunk.cid, obj, chunk.chunk_index, true);
        }
        if (obj.bytes + chunk.data.size() > obj.object_size) {
            reject("chunks exceed declared object size");
        }
    }

    auto& obj = objects_[chunk.cid];
    if (obj.total_chunks == 0) {
        obj.total_chunks = chunk.total_chunks;
        obj.object_size = chunk.object_size;
    }
    obj.bytes += chunk.data.size();
    obj.chunks.emplace(chunk.chunk_index, chunk.data);

    SPDLOG_DEBUG("session {} received chunk {}/{} of {} ({} bytes)", session_id_,
                 chunk.chunk_index + 1, chunk.total_chunks, ctx.cid, chunk.data.size());
    return progress_of(chunk.cid, obj, chunk.chunk_index, false);
}

auto ChunkAssembler::missing_chunks(const Cid& cid) const -> std::vector<std::uint32_t> {
    auto result = std::vector<std::uint32_t>{};
    auto it = objects_.find(cid);
    if (it == objects_.end()) return result;
    for (std::uint32_t i = 0; i < it->second.total_chunks; ++i) {
        if (!it->second.chunks.contains(i)) result.push_back(i);
    }
    return result;
}

auto ChunkAssembler::is_complete(const Cid& cid) const -> bool {
    auto it = objects_.find(cid);
    return it != objects_.end() && it->second.chunks.size() == it->second.total_chunks;
}

auto ChunkAssembler::has_object(const Cid& cid) const -> bool {
    return objects_.contains(cid);
}

auto ChunkAssembler::take_object(const Cid& cid) -> std::vector<std::byte> {
    auto ctx = ErrorContext{.session_id = session_id_, .cid = to_string(cid)};
    auto it = objects_.find(cid);
    if (it == objects_.end() || it->second.chunks.size() != it->second.total_chunks) {
        throw IntegrityError{"object " + ctx.cid + " is incomplete", ctx};
    }

    auto object = std::vector<std::byte>{};
    object.reserve(static_cast<std::size_t>(it->second.object_size));
    for (const auto& [index, data] : it->second.chunks) {
        object.insert(object.end(), data.begin(), data.end());
    }
    const auto declared = it->second.object_size;
    objects_.erase(it);

    if (object.size() != declared || !verify_cid(object, cid)) {
        SPDLOG_WARN("session {}: reassembled object {} failed verification, "
                    "full re-transfer required", session_id_, ctx.cid);
        throw IntegrityError{"reassembled object does not match its cid", ctx};
    }
    return object;
}

auto ChunkAssembler::pending_objects() const -> std::vector<Cid> {
    auto result = std::vector<Cid>{};
    result.reserve(objects_.size());
    for (const auto& [cid, _] : objects_) result.push_back(cid);
    std::ranges::sort(result);
    return result;
}

auto ChunkAssembler::bytes_buffered() const -> std::uint64_t {
    auto total = std::uint64_t{0};
    for (const auto& [_, obj] : objects_) total += obj.bytes;
    return total;
}

void ChunkAssembler::discard(const Cid& cid) {
    objects_.erase(cid);
}

void ChunkAssembler::discard() {
    objects_.clear();
}

}  // namespace l10n_sync
