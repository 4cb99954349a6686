#include "app/settings.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QtGlobal>

namespace vaultsync::app {

namespace {

constexpr const char* kMaxRetries = "sync/maxRetries";
constexpr const char* kBackoffBase = "sync/backoffBaseSeconds";
constexpr const char* kBackoffCap = "sync/backoffCapSeconds";
constexpr const char* kResetDelay = "sync/resetDelaySeconds";
constexpr const char* kWorkerCount = "sync/workerCount";
constexpr const char* kDatabasePath = "storage/databasePath";

// Upper bound for the worker pool; more threads than this only contend on SQLite.
constexpr int kMaxWorkers = 16;

int read_int(const QSettings& settings, const char* key, int fallback, int min, int max) {
    bool ok = false;
    const int value = settings.value(QString::fromLatin1(key), fallback).toInt(&ok);
    if (!ok || value < min || value > max) {
        return fallback;
    }
    return value;
}

QString absolute_with_parent(const QString& path) {
    QFileInfo info(path);
    QDir dir(info.absolutePath());
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return info.absoluteFilePath();
}

} // namespace

SyncSettings SyncSettings::load(const QSettings& settings) {
    SyncSettings out;
    out.max_retries = read_int(settings, kMaxRetries, out.max_retries, 1, 100);
    out.backoff_base = std::chrono::seconds(
        read_int(settings, kBackoffBase, static_cast<int>(out.backoff_base.count()), 1, 86400));
    out.backoff_cap = std::chrono::seconds(
        read_int(settings, kBackoffCap, static_cast<int>(out.backoff_cap.count()), 1, 7 * 86400));
    if (out.backoff_cap < out.backoff_base) {
        out.backoff_cap = out.backoff_base;
    }
    out.reset_delay = std::chrono::seconds(
        read_int(settings, kResetDelay, static_cast<int>(out.reset_delay.count()), 0, 86400));
    out.worker_count = read_int(settings, kWorkerCount, out.worker_count, 1, kMaxWorkers);
    out.database_path = settings.value(QString::fromLatin1(kDatabasePath)).toString();

    bool ok = false;
    const int env_workers = qEnvironmentVariableIntValue("VAULTSYNC_SYNC_WORKERS", &ok);
    if (ok && env_workers >= 1 && env_workers <= kMaxWorkers) {
        out.worker_count = env_workers;
    }

    const auto env_db = qEnvironmentVariable("VAULTSYNC_DB_PATH");
    if (!env_db.isEmpty()) {
        out.database_path = env_db;
    }

    out.database_path = out.database_path.isEmpty()
        ? default_database_path()
        : absolute_with_parent(out.database_path);
    return out;
}

void SyncSettings::save(QSettings& settings) const {
    settings.setValue(QString::fromLatin1(kMaxRetries), max_retries);
    settings.setValue(QString::fromLatin1(kBackoffBase), static_cast<int>(backoff_base.count()));
    settings.setValue(QString::fromLatin1(kBackoffCap), static_cast<int>(backoff_cap.count()));
    settings.setValue(QString::fromLatin1(kResetDelay), static_cast<int>(reset_delay.count()));
    settings.setValue(QString::fromLatin1(kWorkerCount), worker_count);
    settings.setValue(QString::fromLatin1(kDatabasePath), database_path);
}

QString default_database_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir(base);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return dir.filePath(QStringLiteral("vaultsync.db"));
}

} // namespace vaultsync::app
