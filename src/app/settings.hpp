#pragma once

#include <QSettings>
#include <QString>

#include <chrono>

namespace vaultsync::app {

/**
 * SyncSettings - engine tunables.
 *
 * Read from QSettings (keys under sync/ and storage/), then overridden by
 * VAULTSYNC_DB_PATH and VAULTSYNC_SYNC_WORKERS. Out-of-range values fall
 * back to the defaults.
 */
struct SyncSettings {
    int max_retries = 5;
    std::chrono::seconds backoff_base{30};
    std::chrono::seconds backoff_cap{3600};
    std::chrono::seconds reset_delay{60};
    int worker_count = 1;
    QString database_path;

    [[nodiscard]] static SyncSettings load(const QSettings& settings);

    // Write every key back, so a fresh install shows the defaults.
    void save(QSettings& settings) const;
};

/**
 * Where the database lives when neither settings nor environment say:
 * <AppData>/vaultsync.db. The directory is created if missing.
 */
[[nodiscard]] QString default_database_path();

} // namespace vaultsync::app
