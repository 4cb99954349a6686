#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(vaultsyncSyncLog)
Q_DECLARE_LOGGING_CATEGORY(vaultsyncStorageLog)

namespace vaultsync {

// True when VAULTSYNC_DEBUG_SYNC is set; gates the per-note "SYNC:" trace.
[[nodiscard]] bool sync_debug_enabled();

// Turn on debug output for both categories (the CLI's --debug-sync).
void enable_sync_debug();

} // namespace vaultsync
