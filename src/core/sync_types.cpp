#include "core/sync_types.hpp"

#include <array>
#include <utility>

namespace vaultsync {

namespace {

constexpr std::array<std::pair<SyncStatus, std::string_view>, 6> STATUS_NAMES{{
    {SyncStatus::NeverSynced, "never_synced"},
    {SyncStatus::PendingUpload, "pending_upload"},
    {SyncStatus::PendingDownload, "pending_download"},
    {SyncStatus::Synced, "synced"},
    {SyncStatus::Conflict, "conflict"},
    {SyncStatus::Error, "error"},
}};

} // namespace

std::string_view to_string(SyncStatus status) noexcept {
    for (const auto& [value, name] : STATUS_NAMES) {
        if (value == status) return name;
    }
    return "error";
}

std::optional<SyncStatus> parse_sync_status(std::string_view text) noexcept {
    for (const auto& [value, name] : STATUS_NAMES) {
        if (name == text) return value;
    }
    return std::nullopt;
}

} // namespace vaultsync
