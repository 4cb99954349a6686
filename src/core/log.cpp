#include "core/log.hpp"

#include <QtGlobal>

Q_LOGGING_CATEGORY(vaultsyncSyncLog, "vaultsync.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(vaultsyncStorageLog, "vaultsync.storage", QtInfoMsg)

namespace vaultsync {

bool sync_debug_enabled() {
    return qEnvironmentVariableIsSet("VAULTSYNC_DEBUG_SYNC");
}

void enable_sync_debug() {
    qputenv("VAULTSYNC_DEBUG_SYNC", "1");
    QLoggingCategory::setFilterRules(QStringLiteral(
        "vaultsync.sync.debug=true\n"
        "vaultsync.storage.debug=true"));
}

} // namespace vaultsync
