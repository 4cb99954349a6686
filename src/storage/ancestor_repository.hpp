#pragma once

#include "storage/database.hpp"
#include "core/sync_types.hpp"
#include "core/result.hpp"
#include <optional>

namespace vaultsync::storage {

/**
 * AncestorRepository - last content both sides agreed on, per note.
 */
class AncestorRepository {
public:
    explicit AncestorRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<AncestorRecord>, Error> get(const Uuid& note_id);
    [[nodiscard]] Result<void, Error> put(const AncestorRecord& record);
    [[nodiscard]] Result<void, Error> remove(const Uuid& note_id);
    [[nodiscard]] Result<void, Error> remove_for_vault(const Uuid& vault_id);

private:
    Database& db_;
};

} // namespace vaultsync::storage
