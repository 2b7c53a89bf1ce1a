#include <l10n-sync/file_outbox.hpp>

#include <l10n-sync/error.hpp>
#include <l10n-sync/json.hpp>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <exception>
#include <fstream>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace l10n_sync {

namespace {

auto entry_to_json(const OutboxEntry& e) -> nlohmann::json {
    auto delta = nlohmann::json{};
    to_json(delta, e.delta);
    auto created = nlohmann::json{};
    to_json(created, e.created_at);
    return nlohmann::json{
        {"sequence", e.sequence},
        {"client_id", e.client_id},
        {"created_at", created},
        {"delta", delta},
    };
}

auto entry_from_json(const nlohmann::json& j) -> OutboxEntry {
    auto e = OutboxEntry{};
    e.sequence = j.at("sequence").get<std::uint64_t>();
    e.client_id = j.at("client_id").get<std::string>();
    from_json(j.at("created_at"), e.created_at);
    from_json(j.at("delta"), e.delta);
    return e;
}

// Flush a file or directory to stable storage.
void sync_to_disk(const std::filesystem::path& path) {
    auto fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw StorageError{"cannot open " + path.string() + " for sync: " +
                           std::generic_category().message(errno)};
    }
    auto rc = ::fsync(fd);
    auto err = errno;
    ::close(fd);
    if (rc != 0) {
        throw StorageError{"fsync of " + path.string() + " failed: " +
                           std::generic_category().message(err)};
    }
}

}  // namespace

FileOutboxStore::FileOutboxStore(std::filesystem::path path)
    : path_{std::move(path)} {
    load();
}

void FileOutboxStore::load() {
    auto ec = std::error_code{};
    if (!std::filesystem::exists(path_, ec)) return;

    auto in = std::ifstream{path_};
    if (!in) throw StorageError{"cannot open outbox " + path_.string()};

    auto line = std::string{};
    auto line_no = std::size_t{0};
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;
        try {
            auto e = entry_from_json(nlohmann::json::parse(line));
            next_sequence_ = std::max(next_sequence_, e.sequence + 1);
            entries_.push_back(std::move(e));
        } catch (const std::exception& ex) {
            throw StorageError{"outbox " + path_.string() + " line " +
                               std::to_string(line_no) + ": " + ex.what()};
        }
    }
    std::ranges::sort(entries_, {}, &OutboxEntry::sequence);
    SPDLOG_INFO("loaded {} pending outbox entries from {}", entries_.size(), path_.string());
}

void FileOutboxStore::persist(const std::deque<OutboxEntry>& entries) const {
    auto tmp = path_;
    tmp += ".tmp";
    {
        auto out = std::ofstream{tmp, std::ios::trunc};
        if (!out) throw StorageError{"cannot write outbox " + tmp.string()};
        try {
            for (const auto& e : entries) out << entry_to_json(e).dump() << '\n';
        } catch (const nlohmann::json::exception& ex) {
            throw StorageError{"cannot encode outbox entry: " + std::string{ex.what()}};
        }
        out.flush();
        if (!out) throw StorageError{"short write to outbox " + tmp.string()};
    }
    sync_to_disk(tmp);
    auto ec = std::error_code{};
    std::filesystem::rename(tmp, path_, ec);
    if (ec) throw StorageError{"cannot replace outbox " + path_.string() + ": " + ec.message()};

    // The rename itself is durable only once the directory entry is
    auto dir = path_.parent_path();
    sync_to_disk(dir.empty() ? std::filesystem::path{"."} : dir);
}

auto FileOutboxStore::append(std::string_view client_id, EntryDelta delta,
                             Timestamp created_at) -> std::uint64_t {
    auto lock = std::scoped_lock{mutex_};
    auto next = entries_;
    auto seq = next_sequence_;
    next.push_back(OutboxEntry{
        .sequence = seq,
        .client_id = std::string{client_id},
        .delta = std::move(delta),
        .created_at = created_at,
    });
    persist(next);
    entries_ = std::move(next);
    ++next_sequence_;
    return seq;
}

auto FileOutboxStore::pending(std::string_view client_id, std::size_t limit) const
    -> std::vector<OutboxEntry> {
    auto lock = std::scoped_lock{mutex_};
    auto result = std::vector<OutboxEntry>{};
    for (const auto& e : entries_) {
        if (result.size() >= limit) break;
        if (e.client_id == client_id) result.push_back(e);
    }
    return result;
}

void FileOutboxStore::remove(std::span<const std::uint64_t> sequences) {
    auto lock = std::scoped_lock{mutex_};
    auto doomed = std::unordered_set<std::uint64_t>(sequences.begin(), sequences.end());
    auto next = entries_;
    std::erase_if(next, [&](const OutboxEntry& e) { return doomed.contains(e.sequence); });
    if (next.size() == entries_.size()) return;
    persist(next);
    entries_ = std::move(next);
}

auto FileOutboxStore::size() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return entries_.size();
}

auto FileOutboxStore::size(std::string_view client_id) const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return static_cast<std::size_t>(std::ranges::count_if(
        entries_, [&](const OutboxEntry& e) { return e.client_id == client_id; }));
}

}  // namespace l10n_sync
