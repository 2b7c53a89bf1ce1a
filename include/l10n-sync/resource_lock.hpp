/// @file resource_lock.hpp
/// @brief Named, owner-tagged locks with a time-to-live.
///
/// A lock that its owner forgets to release lapses once its TTL passes,
/// and the next acquirer takes it over. Expiry is judged against the
/// injected Clock.

#pragma once

#include <l10n-sync/types.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace l10n_sync {

/// Snapshot of one held lock.
struct LockInfo {
    std::string name;
    std::string owner;
    Timestamp acquired_at{};
    Timestamp expires_at{};

    auto operator==(const LockInfo&) const -> bool = default;
};

class ResourceLockManager {
public:
    ResourceLockManager();
    explicit ResourceLockManager(Clock clock);

    ResourceLockManager(const ResourceLockManager&) = delete;
    auto operator=(const ResourceLockManager&) -> ResourceLockManager& = delete;

    /// Take the lock if it is free, expired, or already held by owner
    /// (which renews the TTL). Returns false if another owner holds it.
    auto try_acquire(std::string_view name, std::string_view owner,
                     std::chrono::milliseconds ttl) -> bool;

    /// Release a lock held by owner. Returns false if owner does not hold it.
    auto release(std::string_view name, std::string_view owner) -> bool;

    /// True if a live (unexpired) lock exists under name.
    auto is_locked(std::string_view name) const -> bool;

    auto holder(std::string_view name) const -> std::optional<LockInfo>;

    /// Drop every expired lock. Returns how many were dropped.
    auto sweep_expired() -> std::size_t;

    auto clock() const -> const Clock& { return clock_; }

private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, LockInfo, std::less<>> locks_;
};

/// RAII holder: acquires in the constructor, releases in the destructor.
class ScopedResourceLock {
public:
    /// Throws ResourceBusyError if another owner holds the lock.
    ScopedResourceLock(ResourceLockManager& manager, std::string name, std::string owner,
                       std::chrono::milliseconds ttl);
    ~ScopedResourceLock();

    ScopedResourceLock(const ScopedResourceLock&) = delete;
    auto operator=(const ScopedResourceLock&) -> ScopedResourceLock& = delete;

    auto name() const -> const std::string& { return name_; }
    auto owner() const -> const std::string& { return owner_; }

private:
    ResourceLockManager& manager_;
    std::string name_;
    std::string owner_;
};

}  // namespace l10n_sync
