#pragma once

#include "storage/database.hpp"
#include "core/repositories.hpp"

namespace vaultsync::storage {

/**
 * SqliteVaultRepository - VaultRepository over the vaults table.
 */
class SqliteVaultRepository final : public VaultRepository {
public:
    explicit SqliteVaultRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::vector<Vault>, Error> get_all_vaults() override;
    [[nodiscard]] Result<std::optional<Vault>, Error> get_vault(const Uuid& id) override;
    [[nodiscard]] Result<void, Error> update_last_synced(const Uuid& id, Timestamp at) override;

    [[nodiscard]] Result<void, Error> save(const Vault& vault);

    /**
     * Deletes the vault and, by cascade, its notes. Sync bookkeeping is
     * removed by the caller.
     */
    [[nodiscard]] Result<void, Error> remove(const Uuid& id);

private:
    Database& db_;

    [[nodiscard]] static Vault row_to_vault(Statement& stmt);
};

} // namespace vaultsync::storage
