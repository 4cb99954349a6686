#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>
#include <optional>

namespace vaultsync {

/**
 * ProviderType - which vault provider reads and writes a vault's files.
 */
enum class ProviderType {
    Local,
    Obsidian,
    Custom
};

/**
 * ConflictStrategy - how the resolver picks a winner when both the local
 * note and the vault copy changed since they last agreed.
 */
enum class ConflictStrategy {
    LastWriteWins,
    LocalWins,
    RemoteWins,
    Merge  // Line-based three-way merge, last-write-wins when lines overlap.
};

[[nodiscard]] std::string_view to_string(ProviderType type) noexcept;
[[nodiscard]] std::optional<ProviderType> parse_provider_type(std::string_view text) noexcept;

[[nodiscard]] std::string_view to_string(ConflictStrategy strategy) noexcept;
[[nodiscard]] std::optional<ConflictStrategy> parse_conflict_strategy(std::string_view text) noexcept;

/**
 * Vault - a user-designated folder that is the durable home for notes.
 */
struct Vault {
    Uuid id;
    std::string name;
    ProviderType provider_type = ProviderType::Local;
    std::string root_path;
    ConflictStrategy conflict_strategy = ConflictStrategy::LastWriteWins;
    bool sync_enabled = true;
    bool is_default = false;
    Timestamp created_at;
    std::optional<Timestamp> last_synced_at;

    bool operator==(const Vault&) const = default;
};

[[nodiscard]] inline Vault create_vault(
    Uuid id,
    std::string name,
    ProviderType provider_type,
    std::string root_path,
    ConflictStrategy strategy = ConflictStrategy::LastWriteWins
) {
    return Vault{
        .id = id,
        .name = std::move(name),
        .provider_type = provider_type,
        .root_path = std::move(root_path),
        .conflict_strategy = strategy,
        .sync_enabled = true,
        .is_default = false,
        .created_at = Timestamp::now(),
        .last_synced_at = std::nullopt
    };
}

} // namespace vaultsync
