#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QTemporaryDir>

#include "app/settings.hpp"

using namespace std::chrono_literals;
using vaultsync::app::SyncSettings;

namespace {

// Clears the overrides so tests do not see the developer's environment.
struct EnvGuard {
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }
    static void clear() {
        qunsetenv("VAULTSYNC_DB_PATH");
        qunsetenv("VAULTSYNC_SYNC_WORKERS");
    }
};

} // namespace

TEST_CASE("SyncSettings: defaults when nothing is configured", "[settings]") {
    QStandardPaths::setTestModeEnabled(true);
    EnvGuard env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("vaultsync.ini")), QSettings::IniFormat);

    const auto loaded = SyncSettings::load(settings);

    REQUIRE(loaded.max_retries == 5);
    REQUIRE(loaded.backoff_base == 30s);
    REQUIRE(loaded.backoff_cap == 3600s);
    REQUIRE(loaded.reset_delay == 60s);
    REQUIRE(loaded.worker_count == 1);
    REQUIRE(loaded.database_path.endsWith(QStringLiteral("vaultsync.db")));
}

TEST_CASE("SyncSettings: reads keys and rejects out-of-range values", "[settings]") {
    EnvGuard env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("vaultsync.ini")), QSettings::IniFormat);

    settings.setValue(QStringLiteral("sync/maxRetries"), 8);
    settings.setValue(QStringLiteral("sync/backoffBaseSeconds"), 10);
    settings.setValue(QStringLiteral("sync/backoffCapSeconds"), 600);
    settings.setValue(QStringLiteral("sync/resetDelaySeconds"), 0);
    settings.setValue(QStringLiteral("sync/workerCount"), 4);
    settings.setValue(QStringLiteral("storage/databasePath"), dir.filePath(QStringLiteral("db/notes.db")));

    auto loaded = SyncSettings::load(settings);
    REQUIRE(loaded.max_retries == 8);
    REQUIRE(loaded.backoff_base == 10s);
    REQUIRE(loaded.backoff_cap == 600s);
    REQUIRE(loaded.reset_delay == 0s);
    REQUIRE(loaded.worker_count == 4);
    REQUIRE(loaded.database_path == QDir(dir.path()).absoluteFilePath(QStringLiteral("db/notes.db")));
    REQUIRE(QDir(dir.filePath(QStringLiteral("db"))).exists());

    SECTION("Invalid values fall back to defaults") {
        settings.setValue(QStringLiteral("sync/maxRetries"), 0);
        settings.setValue(QStringLiteral("sync/workerCount"), 500);
        settings.setValue(QStringLiteral("sync/backoffBaseSeconds"), QStringLiteral("soon"));

        loaded = SyncSettings::load(settings);
        REQUIRE(loaded.max_retries == 5);
        REQUIRE(loaded.worker_count == 1);
        REQUIRE(loaded.backoff_base == 30s);
    }

    SECTION("Cap below base is raised") {
        settings.setValue(QStringLiteral("sync/backoffBaseSeconds"), 120);
        settings.setValue(QStringLiteral("sync/backoffCapSeconds"), 60);

        loaded = SyncSettings::load(settings);
        REQUIRE(loaded.backoff_cap == 120s);
    }

    SECTION("Environment overrides win") {
        qputenv("VAULTSYNC_SYNC_WORKERS", "3");
        qputenv("VAULTSYNC_DB_PATH", dir.filePath(QStringLiteral("env.db")).toUtf8());

        loaded = SyncSettings::load(settings);
        REQUIRE(loaded.worker_count == 3);
        REQUIRE(loaded.database_path == QDir(dir.path()).absoluteFilePath(QStringLiteral("env.db")));
    }

    SECTION("Invalid worker override is ignored") {
        qputenv("VAULTSYNC_SYNC_WORKERS", "lots");
        REQUIRE(SyncSettings::load(settings).worker_count == 4);
    }
}

TEST_CASE("SyncSettings: save writes every key", "[settings]") {
    EnvGuard env;
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("vaultsync.ini"));

    SyncSettings custom;
    custom.max_retries = 3;
    custom.backoff_base = 15s;
    custom.backoff_cap = 900s;
    custom.worker_count = 2;
    custom.database_path = dir.filePath(QStringLiteral("saved.db"));
    {
        QSettings settings(path, QSettings::IniFormat);
        custom.save(settings);
    }

    QSettings reopened(path, QSettings::IniFormat);
    REQUIRE(reopened.value(QStringLiteral("sync/maxRetries")).toInt() == 3);
    REQUIRE(reopened.value(QStringLiteral("sync/resetDelaySeconds")).toInt() == 60);

    const auto loaded = SyncSettings::load(reopened);
    REQUIRE(loaded.max_retries == 3);
    REQUIRE(loaded.backoff_base == 15s);
    REQUIRE(loaded.backoff_cap == 900s);
    REQUIRE(loaded.worker_count == 2);
    REQUIRE(loaded.database_path == custom.database_path);
}
