#include <l10n-sync/resource_lock.hpp>

#include <l10n-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace l10n_sync {

ResourceLockManager::ResourceLockManager()
    : clock_{system_now} {}

ResourceLockManager::ResourceLockManager(Clock clock)
    : clock_{std::move(clock)} {}

auto ResourceLockManager::try_acquire(std::string_view name, std::string_view owner,
                                      std::chrono::milliseconds ttl) -> bool {
    auto now = clock_();
    auto lock = std::scoped_lock{mutex_};
    auto it = locks_.find(name);
    if (it != locks_.end()) {
        auto& held = it->second;
        if (held.owner == owner) {
            held.expires_at = now + ttl;
            return true;
        }
        if (held.expires_at > now) return false;
        SPDLOG_WARN("lock {} held by {} expired, taking over for {}", held.name, held.owner, owner);
        locks_.erase(it);
    }
    locks_.emplace(std::string{name}, LockInfo{
        .name = std::string{name},
        .owner = std::string{owner},
        .acquired_at = now,
        .expires_at = now + ttl,
    });
    SPDLOG_DEBUG("lock {} acquired by {}", name, owner);
    return true;
}

auto ResourceLockManager::release(std::string_view name, std::string_view owner) -> bool {
    auto lock = std::scoped_lock{mutex_};
    auto it = locks_.find(name);
    if (it == locks_.end() || it->second.owner != owner) return false;
    locks_.erase(it);
    SPDLOG_DEBUG("lock {} released by {}", name, owner);
    return true;
}

auto ResourceLockManager::is_locked(std::string_view name) const -> bool {
    return holder(name).has_value();
}

auto ResourceLockManager::holder(std::string_view name) const -> std::optional<LockInfo> {
    auto now = clock_();
    auto lock = std::scoped_lock{mutex_};
    auto it = locks_.find(name);
    if (it == locks_.end() || it->second.expires_at <= now) return std::nullopt;
    return it->second;
}

auto ResourceLockManager::sweep_expired() -> std::size_t {
    auto now = clock_();
    auto lock = std::scoped_lock{mutex_};
    return std::erase_if(locks_, [&](const auto& kv) { return kv.second.expires_at <= now; });
}

// -- ScopedResourceLock -------------------------------------------------------

ScopedResourceLock::ScopedResourceLock(ResourceLockManager& manager, std::string name,
                                       std::string owner, std::chrono::milliseconds ttl)
    : manager_{manager}, name_{std::move(name)}, owner_{std::move(owner)} {
    if (!manager_.try_acquire(name_, owner_, ttl)) {
        auto held = manager_.holder(name_);
        throw ResourceBusyError{name_, held ? held->owner : std::string{"another owner"}};
    }
}

ScopedResourceLock::~ScopedResourceLock() {
    if (!manager_.release(name_, owner_)) {
        SPDLOG_WARN("lock {} was no longer held by {} at release", name_, owner_);
    }
}

}  // namespace l10n_sync
