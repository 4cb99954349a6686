#pragma once

#include "sync/provider.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vaultsync::testing {

/**
 * FakeProvider - in-memory vault files with switchable failures.
 *
 * Saves stamp the file with the note's updated_at, so the "vault mtime" is
 * predictable. Safe to call from several sweep workers at once.
 */
class FakeProvider final : public sync::Provider {
public:
    struct File {
        std::string content;
        Timestamp modified_at;
        std::string path;
    };

    bool is_available(const Vault& vault) override {
        std::lock_guard lock(mutex_);
        return available_ && !offline_vaults_.contains(vault.id);
    }

    Result<std::string, Error> save_note(const Note& note, const Vault& vault) override {
        save_calls_.fetch_add(1);
        {
            std::lock_guard lock(mutex_);
            if (!in_flight_.insert(note.id).second) {
                overlapping_saves_ = true;
            }
        }
        if (save_delay_.count() > 0) {
            std::this_thread::sleep_for(save_delay_);
        }

        std::lock_guard lock(mutex_);
        in_flight_.erase(note.id);
        if (fail_saves_) {
            return Result<std::string, Error>::err(
                Error{ErrorKind::ProviderWrite, "disk full"});
        }
        auto path = path_for(note.id, vault);
        files_[note.id] = File{note.content, note.updated_at, path};
        return Result<std::string, Error>::ok(path);
    }

    Result<NoteVersion, Error> load_note(const Uuid& note_id, const Vault&) override {
        load_calls_.fetch_add(1);
        std::lock_guard lock(mutex_);
        if (fail_loads_) {
            return Result<NoteVersion, Error>::err(
                Error{ErrorKind::ProviderRead, "read failed"});
        }
        auto it = files_.find(note_id);
        if (it == files_.end()) {
            return Result<NoteVersion, Error>::err(
                Error{ErrorKind::NotFound, "no file for " + note_id.to_string()});
        }
        return Result<NoteVersion, Error>::ok(
            make_version(note_id, it->second.content, it->second.modified_at));
    }

    Result<std::optional<sync::RemoteMetadata>, Error> get_metadata(
        const Uuid& note_id, const Vault&) override {
        using R = Result<std::optional<sync::RemoteMetadata>, Error>;
        std::lock_guard lock(mutex_);
        if (fail_metadata_) {
            return R::err(Error{ErrorKind::ProviderRead, "stat failed"});
        }
        auto it = files_.find(note_id);
        if (it == files_.end()) {
            return R::ok(std::nullopt);
        }
        return R::ok(sync::RemoteMetadata{
            note_id, it->second.path, it->second.modified_at, content_hash(it->second.content)});
    }

    Result<std::vector<sync::RemoteMetadata>, Error> list_notes(const Vault& vault) override {
        using R = Result<std::vector<sync::RemoteMetadata>, Error>;
        list_calls_.fetch_add(1);
        std::lock_guard lock(mutex_);
        if (fail_metadata_) {
            return R::err(Error{ErrorKind::ProviderRead, "listing failed"});
        }
        const auto prefix = vault.root_path + "/";
        std::vector<sync::RemoteMetadata> listed;
        for (const auto& [id, file] : files_) {
            if (file.path.starts_with(prefix)) {
                listed.push_back(sync::RemoteMetadata{
                    id, file.path, file.modified_at, content_hash(file.content)});
            }
        }
        return R::ok(std::move(listed));
    }

    Result<void, Error> delete_note(const Uuid& note_id, const Vault&) override {
        std::lock_guard lock(mutex_);
        files_.erase(note_id);
        return Result<void, Error>::ok();
    }

    // Simulate an edit made in the vault by another program.
    void put_file(const Uuid& note_id, const Vault& vault, std::string content, Timestamp modified_at) {
        std::lock_guard lock(mutex_);
        files_[note_id] = File{std::move(content), modified_at, path_for(note_id, vault)};
    }

    [[nodiscard]] std::optional<File> file(const Uuid& note_id) const {
        std::lock_guard lock(mutex_);
        auto it = files_.find(note_id);
        if (it == files_.end()) return std::nullopt;
        return it->second;
    }

    void set_available(bool available) {
        std::lock_guard lock(mutex_);
        available_ = available;
    }

    void set_vault_offline(const Uuid& vault_id, bool offline) {
        std::lock_guard lock(mutex_);
        if (offline) {
            offline_vaults_.insert(vault_id);
        } else {
            offline_vaults_.erase(vault_id);
        }
    }

    void fail_saves(bool fail) { std::lock_guard lock(mutex_); fail_saves_ = fail; }
    void fail_loads(bool fail) { std::lock_guard lock(mutex_); fail_loads_ = fail; }
    void fail_metadata(bool fail) { std::lock_guard lock(mutex_); fail_metadata_ = fail; }
    void set_save_delay(std::chrono::milliseconds delay) { save_delay_ = delay; }

    [[nodiscard]] int save_calls() const { return save_calls_.load(); }
    [[nodiscard]] int load_calls() const { return load_calls_.load(); }
    [[nodiscard]] int list_calls() const { return list_calls_.load(); }
    [[nodiscard]] bool overlapping_saves() const {
        std::lock_guard lock(mutex_);
        return overlapping_saves_;
    }

    [[nodiscard]] static std::string path_for(const Uuid& note_id, const Vault& vault) {
        return vault.root_path + "/" + note_id.to_string() + ".md";
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Uuid, File> files_;
    std::unordered_set<Uuid> offline_vaults_;
    std::unordered_set<Uuid> in_flight_;
    bool available_ = true;
    bool fail_saves_ = false;
    bool fail_loads_ = false;
    bool fail_metadata_ = false;
    bool overlapping_saves_ = false;
    std::chrono::milliseconds save_delay_{0};
    std::atomic<int> save_calls_{0};
    std::atomic<int> load_calls_{0};
    std::atomic<int> list_calls_{0};
};

} // namespace vaultsync::testing
