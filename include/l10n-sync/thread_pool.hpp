/// @file thread_pool.hpp
/// @brief The worker pool type the hub runs session tasks on.
///
/// BS::thread_pool v2 (single header <thread_pool.hpp>). Callers create
/// one with std::make_shared<l10n_sync::thread_pool>(n) and hand it to
/// every SyncHub that should share it.

#pragma once

#include <thread_pool.hpp>

namespace l10n_sync {

using thread_pool = ::thread_pool;

}  // namespace l10n_sync
