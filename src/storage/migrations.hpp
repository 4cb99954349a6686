#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace vaultsync::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "vaults_and_notes",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS vaults (
                id TEXT PRIMARY KEY,
                name TEXT NOT NULL,
                provider_type TEXT NOT NULL,
                root_path TEXT NOT NULL,
                conflict_strategy TEXT NOT NULL DEFAULT 'last_write_wins',
                sync_enabled INTEGER NOT NULL DEFAULT 1,
                is_default INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL,
                last_synced_at INTEGER
            );

            CREATE TABLE IF NOT EXISTS notes (
                id TEXT PRIMARY KEY,
                vault_id TEXT NOT NULL REFERENCES vaults(id) ON DELETE CASCADE,
                title TEXT NOT NULL DEFAULT '',
                content TEXT NOT NULL DEFAULT '',
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL,
                file_path TEXT,
                is_synced INTEGER NOT NULL DEFAULT 0
            );
            CREATE INDEX IF NOT EXISTS idx_notes_vault ON notes(vault_id);
            CREATE INDEX IF NOT EXISTS idx_notes_unsynced ON notes(vault_id, is_synced);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS notes;
            DROP TABLE IF EXISTS vaults;
        )SQL"
    },
    {
        .version = 2,
        .name = "sync_state",
        .up_sql = R"SQL(
            -- No foreign key on note_id: a pending download may precede the note row.
            CREATE TABLE IF NOT EXISTS sync_states (
                note_id TEXT PRIMARY KEY,
                vault_id TEXT NOT NULL,
                status TEXT NOT NULL,
                local_modified_at INTEGER NOT NULL,
                remote_modified_at INTEGER,
                last_synced_at INTEGER,
                remote_path TEXT,
                ancestor_hash TEXT,
                retry_count INTEGER NOT NULL DEFAULT 0,
                last_error TEXT
            );
            CREATE INDEX IF NOT EXISTS idx_sync_states_vault ON sync_states(vault_id);
            CREATE INDEX IF NOT EXISTS idx_sync_states_status ON sync_states(vault_id, status);

            CREATE TABLE IF NOT EXISTS sync_queue (
                note_id TEXT PRIMARY KEY,
                vault_id TEXT NOT NULL,
                retry_count INTEGER NOT NULL DEFAULT 0,
                last_attempt_at INTEGER NOT NULL,
                next_retry_at INTEGER NOT NULL,
                last_error_message TEXT,
                created_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_sync_queue_next ON sync_queue(next_retry_at);
            CREATE INDEX IF NOT EXISTS idx_sync_queue_vault ON sync_queue(vault_id);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS sync_queue;
            DROP TABLE IF EXISTS sync_states;
        )SQL"
    },
    {
        .version = 3,
        .name = "sync_ancestors",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS sync_ancestors (
                note_id TEXT PRIMARY KEY,
                vault_id TEXT NOT NULL,
                content_hash TEXT NOT NULL,
                content TEXT NOT NULL,
                recorded_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_sync_ancestors_vault ON sync_ancestors(vault_id);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS sync_ancestors;
        )SQL"
    }
};

/**
 * MigrationRunner - Runs database migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Rollback to a specific version.
     */
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
    [[nodiscard]] Result<void, Error> record_version(const Migration& m);
};

/**
 * Open-and-migrate helper used by the CLI and the tests.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace vaultsync::storage
