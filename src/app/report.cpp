#include "app/report.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

namespace vaultsync::app {

namespace {

constexpr SyncStatus kStatusOrder[] = {
    SyncStatus::Synced,
    SyncStatus::PendingUpload,
    SyncStatus::PendingDownload,
    SyncStatus::NeverSynced,
    SyncStatus::Conflict,
    SyncStatus::Error,
};

QString text(std::string_view s) {
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
}

QString id_text(const Uuid& id) {
    return QString::fromStdString(id.to_string());
}

QString time_text(Timestamp at) {
    return QString::fromStdString(at.to_iso_string());
}

} // namespace

Result<std::vector<VaultStatus>, Error> collect_status(
    VaultRepository& vaults,
    storage::SyncStateRepository& states,
    storage::RetryQueueRepository& queue
) {
    using R = Result<std::vector<VaultStatus>, Error>;

    auto all = vaults.get_all_vaults();
    if (all.is_err()) {
        return R::err(all.unwrap_err());
    }

    std::vector<VaultStatus> rows;
    for (const auto& vault : all.unwrap()) {
        auto stats = states.statistics(vault.id);
        if (stats.is_err()) {
            return R::err(stats.unwrap_err());
        }
        auto items = queue.get_for_vault(vault.id);
        if (items.is_err()) {
            return R::err(items.unwrap_err());
        }

        VaultStatus row{.vault = vault, .counts = std::move(stats).unwrap()};
        int total = 0;
        for (const auto& [status, count] : row.counts) {
            total += count;
        }
        if (total > 0) {
            row.progress = row.counts[SyncStatus::Synced] * 100 / total;
        }
        for (const auto& item : items.unwrap()) {
            ++row.queued;
            if (item.has_exceeded(queue.max_retries())) {
                ++row.failed;
            }
        }
        rows.push_back(std::move(row));
    }
    return R::ok(std::move(rows));
}

QString format_status(const std::vector<VaultStatus>& rows) {
    QString out;
    QTextStream stream(&out);

    if (rows.empty()) {
        stream << "No vaults configured.\n";
        return out;
    }

    for (const auto& row : rows) {
        stream << QString::fromStdString(row.vault.name)
               << " (" << text(to_string(row.vault.provider_type)) << ")";
        if (!row.vault.sync_enabled) {
            stream << " [sync disabled]";
        }
        stream << "\n";
        stream << "  progress: " << row.progress << "%\n";
        for (const auto status : kStatusOrder) {
            const auto it = row.counts.find(status);
            const int count = it == row.counts.end() ? 0 : it->second;
            if (count > 0) {
                stream << "  " << text(to_string(status)) << ": " << count << "\n";
            }
        }
        stream << "  retry queue: " << row.queued << " (" << row.failed << " failed)\n";
        if (row.vault.last_synced_at) {
            stream << "  last synced: " << time_text(*row.vault.last_synced_at) << "\n";
        }
    }
    return out;
}

QString format_status_json(const std::vector<VaultStatus>& rows) {
    QJsonArray vaults;
    for (const auto& row : rows) {
        QJsonObject counts;
        for (const auto& [status, count] : row.counts) {
            counts.insert(text(to_string(status)), count);
        }

        QJsonObject obj;
        obj.insert(QStringLiteral("vaultId"), id_text(row.vault.id));
        obj.insert(QStringLiteral("name"), QString::fromStdString(row.vault.name));
        obj.insert(QStringLiteral("provider"), text(to_string(row.vault.provider_type)));
        obj.insert(QStringLiteral("syncEnabled"), row.vault.sync_enabled);
        if (row.vault.last_synced_at) {
            obj.insert(QStringLiteral("lastSyncedAt"), time_text(*row.vault.last_synced_at));
        }
        obj.insert(QStringLiteral("progress"), row.progress);
        obj.insert(QStringLiteral("queued"), row.queued);
        obj.insert(QStringLiteral("failed"), row.failed);
        obj.insert(QStringLiteral("counts"), counts);
        vaults.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("vaults"), vaults);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_failed_items(const std::vector<RetryQueueItem>& items) {
    QString out;
    QTextStream stream(&out);

    if (items.empty()) {
        stream << "No failed notes.\n";
        return out;
    }

    for (const auto& item : items) {
        stream << id_text(item.note_id)
               << "  retries=" << item.retry_count
               << "  last attempt " << time_text(item.last_attempt_at);
        if (item.last_error_message) {
            stream << "  error: " << QString::fromStdString(*item.last_error_message);
        }
        stream << "\n";
    }
    return out;
}

QString format_failed_items_json(const std::vector<RetryQueueItem>& items) {
    QJsonArray failed;
    for (const auto& item : items) {
        QJsonObject obj;
        obj.insert(QStringLiteral("noteId"), id_text(item.note_id));
        obj.insert(QStringLiteral("vaultId"), id_text(item.vault_id));
        obj.insert(QStringLiteral("retryCount"), item.retry_count);
        obj.insert(QStringLiteral("lastAttemptAt"), time_text(item.last_attempt_at));
        obj.insert(QStringLiteral("nextRetryAt"), time_text(item.next_retry_at));
        if (item.last_error_message) {
            obj.insert(QStringLiteral("lastError"), QString::fromStdString(*item.last_error_message));
        }
        failed.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("failed"), failed);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

} // namespace vaultsync::app
