#pragma once

#include "core/note.hpp"
#include "core/vault.hpp"
#include "core/result.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vaultsync::sync {

/**
 * RemoteMetadata - what the vault reports about a note's file without
 * reading its body.
 */
struct RemoteMetadata {
    Uuid note_id;
    std::string path;
    Timestamp modified_at;
    std::string content_hash;
};

/**
 * Provider - reads and writes note files in one kind of vault.
 *
 * Failures are reported with ErrorKind::ProviderUnavailable,
 * ProviderWrite or ProviderRead; the coordinator treats all three as
 * retryable.
 */
class Provider {
public:
    virtual ~Provider() = default;

    [[nodiscard]] virtual bool is_available(const Vault& vault) = 0;

    /**
     * Write the note; returns the path it was written to.
     */
    [[nodiscard]] virtual Result<std::string, Error> save_note(const Note& note, const Vault& vault) = 0;

    [[nodiscard]] virtual Result<NoteVersion, Error> load_note(const Uuid& note_id, const Vault& vault) = 0;

    /**
     * nullopt when the vault has no file for the note.
     */
    [[nodiscard]] virtual Result<std::optional<RemoteMetadata>, Error> get_metadata(
        const Uuid& note_id, const Vault& vault) = 0;

    /**
     * Every note file currently in the vault, in no particular order.
     */
    [[nodiscard]] virtual Result<std::vector<RemoteMetadata>, Error> list_notes(const Vault& vault) = 0;

    [[nodiscard]] virtual Result<void, Error> delete_note(const Uuid& note_id, const Vault& vault) = 0;
};

/**
 * ProviderRegistry - maps a vault's provider type to its Provider.
 */
class ProviderRegistry {
public:
    void register_provider(ProviderType type, std::shared_ptr<Provider> provider) {
        providers_[type] = std::move(provider);
    }

    /**
     * nullptr when no provider is registered for the vault's type.
     */
    [[nodiscard]] std::shared_ptr<Provider> provider_for(const Vault& vault) const {
        auto it = providers_.find(vault.provider_type);
        return it == providers_.end() ? nullptr : it->second;
    }

private:
    std::map<ProviderType, std::shared_ptr<Provider>> providers_;
};

} // namespace vaultsync::sync
