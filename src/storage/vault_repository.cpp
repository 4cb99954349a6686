#include "storage/vault_repository.hpp"
#include "core/log.hpp"

namespace vaultsync::storage {

namespace {

constexpr const char* SELECT_COLUMNS = R"SQL(
    SELECT id, name, provider_type, root_path, conflict_strategy,
           sync_enabled, is_default, created_at, last_synced_at
    FROM vaults )SQL";

} // namespace

Vault SqliteVaultRepository::row_to_vault(Statement& stmt) {
    const auto provider_text = stmt.column_text(2);
    const auto strategy_text = stmt.column_text(4);
    auto provider = parse_provider_type(provider_text);
    auto strategy = parse_conflict_strategy(strategy_text);
    if (!provider || !strategy) {
        qCWarning(vaultsyncStorageLog) << "vault" << stmt.column_text(0).c_str()
                                       << "has unknown provider/strategy"
                                       << provider_text.c_str() << strategy_text.c_str();
    }

    return Vault{
        .id = stmt.column_uuid(0),
        .name = stmt.column_text(1),
        .provider_type = provider.value_or(ProviderType::Custom),
        .root_path = stmt.column_text(3),
        .conflict_strategy = strategy.value_or(ConflictStrategy::LastWriteWins),
        .sync_enabled = stmt.column_int(5) != 0,
        .is_default = stmt.column_int(6) != 0,
        .created_at = stmt.column_timestamp(7),
        .last_synced_at = stmt.column_optional_timestamp(8)
    };
}

Result<std::vector<Vault>, Error> SqliteVaultRepository::get_all_vaults() {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare(std::string(SELECT_COLUMNS) +
                                   "ORDER BY is_default DESC, created_at ASC;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Vault>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return collect_rows<Vault>(stmt, row_to_vault);
}

Result<std::optional<Vault>, Error> SqliteVaultRepository::get_vault(const Uuid& id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, std::string(SELECT_COLUMNS) + "WHERE id = ?;", id);
    if (stmt_result.is_err()) {
        return Result<std::optional<Vault>, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return first_row<Vault>(stmt, row_to_vault);
}

Result<void, Error> SqliteVaultRepository::update_last_synced(const Uuid& id, Timestamp at) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, "UPDATE vaults SET last_synced_at = ? WHERE id = ?;",
                                     at, id);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

Result<void, Error> SqliteVaultRepository::save(const Vault& vault) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, R"SQL(
        INSERT INTO vaults (id, name, provider_type, root_path, conflict_strategy,
                            sync_enabled, is_default, created_at, last_synced_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            name = excluded.name,
            provider_type = excluded.provider_type,
            root_path = excluded.root_path,
            conflict_strategy = excluded.conflict_strategy,
            sync_enabled = excluded.sync_enabled,
            is_default = excluded.is_default,
            last_synced_at = excluded.last_synced_at;
    )SQL",
        vault.id, vault.name, to_string(vault.provider_type), vault.root_path,
        to_string(vault.conflict_strategy), vault.sync_enabled, vault.is_default,
        vault.created_at, vault.last_synced_at);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

Result<void, Error> SqliteVaultRepository::remove(const Uuid& id) {
    auto guard = db_.lock();
    auto stmt_result = prepare_bound(db_, "DELETE FROM vaults WHERE id = ?;", id);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return run(stmt);
}

} // namespace vaultsync::storage
