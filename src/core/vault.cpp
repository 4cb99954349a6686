#include "core/vault.hpp"

namespace vaultsync {

std::string_view to_string(ProviderType type) noexcept {
    switch (type) {
        case ProviderType::Local: return "local";
        case ProviderType::Obsidian: return "obsidian";
        case ProviderType::Custom: return "custom";
    }
    return "custom";
}

std::optional<ProviderType> parse_provider_type(std::string_view text) noexcept {
    if (text == "local") return ProviderType::Local;
    if (text == "obsidian") return ProviderType::Obsidian;
    if (text == "custom") return ProviderType::Custom;
    return std::nullopt;
}

std::string_view to_string(ConflictStrategy strategy) noexcept {
    switch (strategy) {
        case ConflictStrategy::LastWriteWins: return "last_write_wins";
        case ConflictStrategy::LocalWins: return "local_wins";
        case ConflictStrategy::RemoteWins: return "remote_wins";
        case ConflictStrategy::Merge: return "merge";
    }
    return "last_write_wins";
}

std::optional<ConflictStrategy> parse_conflict_strategy(std::string_view text) noexcept {
    if (text == "last_write_wins") return ConflictStrategy::LastWriteWins;
    if (text == "local_wins") return ConflictStrategy::LocalWins;
    if (text == "remote_wins") return ConflictStrategy::RemoteWins;
    if (text == "merge") return ConflictStrategy::Merge;
    return std::nullopt;
}

} // namespace vaultsync
