/// @file chunk_transfer.hpp
/// @brief Splitting objects into verified chunks and resumable reassembly.

#pragma once

#include <l10n-sync/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace l10n_sync {

/// One slice of a content object in transit.
struct ChunkMessage {
    std::string session_id;
    Cid cid;                          ///< Cid of the whole object.
    std::uint32_t chunk_index{0};     ///< Zero-based.
    std::uint32_t total_chunks{0};
    std::vector<std::byte> data;
    Cid chunk_hash;                   ///< Cid of data.
    std::uint64_t data_size{0};       ///< data.size() as declared by the sender.
    std::uint64_t object_size{0};     ///< Size of the whole object.

    auto operator==(const ChunkMessage&) const -> bool = default;
};

/// State of one object after a chunk was accepted.
struct ChunkProgress {
    Cid cid;
    std::uint32_t chunk_index{0};
    bool duplicate{false};            ///< The chunk had already been received.
    bool object_complete{false};      ///< Every chunk is present.
    std::uint32_t chunks_received{0};
    std::uint32_t total_chunks{0};
    std::uint64_t bytes_received{0};
    std::uint64_t object_size{0};
    std::optional<std::uint32_t> next_chunk_index;  ///< Lowest missing index.
};

/// Number of chunks an object of object_size bytes is split into.
/// An empty object still travels as one empty chunk.
auto chunk_count(std::uint64_t object_size, std::size_t chunk_size) -> std::uint32_t;

/// Build chunk index of object. Throws std::out_of_range for a bad index
/// and std::invalid_argument for a zero chunk size.
auto make_chunk(std::string_view session_id, const Cid& cid,
                std::span<const std::byte> object, std::uint32_t index,
                std::size_t chunk_size) -> ChunkMessage;

/// Split object into chunk_size pieces, each carrying its own hash.
auto split_into_chunks(std::string_view session_id, std::span<const std::byte> object,
                       std::size_t chunk_size) -> std::vector<ChunkMessage>;

/// Reassembles chunked objects for one session.
///
/// Chunks may arrive in any order and more than once. Every chunk is
/// verified on arrival; a rejected chunk leaves previously verified chunks
/// untouched, so the sender can resume from missing_chunks(). Not
/// thread-safe: callers serialize access per session.
class ChunkAssembler {
public:
    explicit ChunkAssembler(std::string session_id);

    /// Verify and store a chunk. Throws IntegrityError (with session, cid
    /// and chunk index context) if the chunk hash, index, declared size or
    /// chunk count disagree.
    auto receive(const ChunkMessage& chunk) -> ChunkProgress;

    /// Indices not yet received. Empty for unknown objects.
    auto missing_chunks(const Cid& cid) const -> std::vector<std::uint32_t>;

    auto is_complete(const Cid& cid) const -> bool;
    auto has_object(const Cid& cid) const -> bool;

    /// Concatenate the chunks and verify the object's Cid.
    /// On success the object is removed from the assembler. On a Cid
    /// mismatch every chunk of the object is dropped (the whole object must
    /// be re-sent) and IntegrityError is thrown. Also throws IntegrityError
    /// if chunks are still missing.
    auto take_object(const Cid& cid) -> std::vector<std::byte>;

    /// Objects with at least one chunk buffered.
    auto pending_objects() const -> std::vector<Cid>;

    auto bytes_buffered() const -> std::uint64_t;

    void discard(const Cid& cid);
    void discard();

    auto session_id() const -> const std::string& { return session_id_; }

private:
    struct PartialObject {
        std::uint32_t total_chunks{0};
        std::uint64_t object_size{0};
        std::uint64_t bytes{0};
        std::map<std::uint32_t, std::vector<std::byte>> chunks;
    };

    auto progress_of(const Cid& cid, const PartialObject& obj, std::uint32_t index,
                     bool duplicate) const -> ChunkProgress;

    std::string session_id_;
    std::unordered_map<Cid, PartialObject> objects_;
};

}  // namespace l10n_sync
