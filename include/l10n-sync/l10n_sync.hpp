/// @file l10n_sync.hpp
/// @brief Umbrella header for the l10n-sync library.
///
/// Include this single header for access to all public types:
/// TranslationEntry, EntryDelta, MergeEngine, OverrideChain, the stores,
/// SyncHub, SyncClient, SyncConfig and the protocol messages.

#pragma once

#include <l10n-sync/bloom_filter.hpp>
#include <l10n-sync/chunk_transfer.hpp>
#include <l10n-sync/config.hpp>
#include <l10n-sync/content_address.hpp>
#include <l10n-sync/delta_applier.hpp>
#include <l10n-sync/entry_delta.hpp>
#include <l10n-sync/error.hpp>
#include <l10n-sync/file_outbox.hpp>
#include <l10n-sync/json.hpp>
#include <l10n-sync/memory_store.hpp>
#include <l10n-sync/merge.hpp>
#include <l10n-sync/metrics.hpp>
#include <l10n-sync/override_chain.hpp>
#include <l10n-sync/protocol.hpp>
#include <l10n-sync/resource_lock.hpp>
#include <l10n-sync/store.hpp>
#include <l10n-sync/sync_client.hpp>
#include <l10n-sync/sync_hub.hpp>
#include <l10n-sync/sync_session.hpp>
#include <l10n-sync/translation_entry.hpp>
#include <l10n-sync/types.hpp>
#include <l10n-sync/uida.hpp>
