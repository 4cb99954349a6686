#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>

#include <optional>

#include "app/logging.hpp"
#include "app/report.hpp"
#include "app/settings.hpp"
#include "core/clock.hpp"
#include "core/content_hash.hpp"
#include "core/log.hpp"
#include "storage/ancestor_repository.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/note_repository.hpp"
#include "storage/retry_queue_repository.hpp"
#include "storage/sync_state_repository.hpp"
#include "storage/vault_repository.hpp"
#include "sync/sync_coordinator.hpp"

namespace {

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 1;
}

int fail(const vaultsync::Error& error) {
    return fail(QString::fromStdString(error.message));
}

std::optional<vaultsync::Uuid> parse_id(const QStringList& positional) {
    if (positional.size() < 2) {
        return std::nullopt;
    }
    return vaultsync::Uuid::parse(positional.at(1).toStdString());
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("vaultsync");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("vaultsync");
    app.setOrganizationDomain("vaultsync.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Inspect and repair note sync state.\n\n"
        "Commands:\n"
        "  status            Per-vault sync counts and progress\n"
        "  failed            Notes that exhausted their retries\n"
        "  retry <noteId>    Reschedule one queued note\n"
        "  retry-all         Reschedule every failed note\n"
        "  cleanup           Drop bookkeeping rows for synced notes\n"
        "  resync <vaultId>  Forget sync history and re-upload the vault"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets VAULTSYNC_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (status and failed)."));
    parser.addOption(jsonOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Also write log output to the application log file."));
    parser.addOption(logFileOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets VAULTSYNC_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run (e.g. 'status')."));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("VAULTSYNC_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        vaultsync::enable_sync_debug();
    }
    if (parser.isSet(logFileOption)) {
        vaultsync::app::install_file_logging();
        qInfo() << "vaultsync: logging to" << vaultsync::app::default_log_file_path();
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const auto command = positional.first();

    auto hashing = vaultsync::init_hashing();
    if (hashing.is_err()) {
        return fail(hashing.unwrap_err());
    }

    QSettings qsettings;
    const auto settings = vaultsync::app::SyncSettings::load(qsettings);

    auto db_result = vaultsync::storage::Database::open(settings.database_path.toStdString());
    if (db_result.is_err()) {
        return fail(QStringLiteral("Cannot open %1: %2")
                        .arg(settings.database_path,
                             QString::fromStdString(db_result.unwrap_err().message)));
    }
    auto db = std::move(db_result).unwrap();
    auto migrated = vaultsync::storage::initialize_database(db);
    if (migrated.is_err()) {
        return fail(migrated.unwrap_err());
    }

    vaultsync::storage::SyncStateRepository states(db);
    vaultsync::storage::RetryQueueRepository queue(db, settings.max_retries, settings.reset_delay);
    vaultsync::storage::AncestorRepository ancestors(db);
    vaultsync::storage::SqliteNoteRepository notes(db);
    vaultsync::storage::SqliteVaultRepository vaults(db);
    vaultsync::SystemClock clock;
    const bool json = parser.isSet(jsonOption);

    QTextStream out(stdout);

    if (command == QStringLiteral("status")) {
        auto rows = vaultsync::app::collect_status(vaults, states, queue);
        if (rows.is_err()) {
            return fail(rows.unwrap_err());
        }
        out << (json ? vaultsync::app::format_status_json(rows.unwrap())
                     : vaultsync::app::format_status(rows.unwrap()));
        return 0;
    }

    if (command == QStringLiteral("failed")) {
        auto items = queue.get_failed_items();
        if (items.is_err()) {
            return fail(items.unwrap_err());
        }
        out << (json ? vaultsync::app::format_failed_items_json(items.unwrap())
                     : vaultsync::app::format_failed_items(items.unwrap()));
        return 0;
    }

    if (command == QStringLiteral("retry")) {
        const auto note_id = parse_id(positional);
        if (!note_id) {
            return fail(QStringLiteral("retry: expected a note ID"));
        }
        auto reset = queue.reset_retry_count(*note_id, clock.now());
        if (reset.is_err()) {
            return fail(reset.unwrap_err());
        }
        if (!reset.unwrap()) {
            return fail(QStringLiteral("retry: note %1 is not in the retry queue").arg(positional.at(1)));
        }
        out << "Rescheduled " << positional.at(1) << "\n";
        return 0;
    }

    if (command == QStringLiteral("retry-all")) {
        auto reset = queue.reset_all_failed_items(clock.now());
        if (reset.is_err()) {
            return fail(reset.unwrap_err());
        }
        auto cleared = states.reset_retry_counts_for_errors();
        if (cleared.is_err()) {
            return fail(cleared.unwrap_err());
        }
        out << "Rescheduled " << reset.unwrap() << " failed note(s)\n";
        return 0;
    }

    if (command == QStringLiteral("cleanup")) {
        auto removed = states.remove_synced();
        if (removed.is_err()) {
            return fail(removed.unwrap_err());
        }
        out << "Removed " << removed.unwrap() << " synced row(s)\n";
        return 0;
    }

    if (command == QStringLiteral("resync")) {
        const auto vault_id = parse_id(positional);
        if (!vault_id) {
            return fail(QStringLiteral("resync: expected a vault ID"));
        }
        auto vault = vaults.get_vault(*vault_id);
        if (vault.is_err()) {
            return fail(vault.unwrap_err());
        }
        if (!vault.unwrap()) {
            return fail(QStringLiteral("resync: no vault %1").arg(positional.at(1)));
        }

        // Sweeps run in the host app; the CLI only reschedules.
        vaultsync::sync::ProviderRegistry providers;
        vaultsync::sync::SyncCoordinator coordinator(
            states, queue, ancestors, notes, vaults, providers, clock,
            vaultsync::sync::BackoffPolicy(settings.backoff_base, settings.backoff_cap));
        auto scheduled = coordinator.force_resync(*vault_id);
        if (scheduled.is_err()) {
            return fail(scheduled.unwrap_err());
        }
        out << "Scheduled " << scheduled.unwrap() << " note(s) for upload\n";
        return 0;
    }

    return fail(QStringLiteral("Unknown command '%1'. See --help.").arg(command));
}
