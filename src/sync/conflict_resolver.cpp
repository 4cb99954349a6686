#include "sync/conflict_resolver.hpp"
#include "core/three_way_merge.hpp"

namespace vaultsync::sync {

namespace {

ConflictDecision local_wins(const NoteVersion& local, bool both_changed, std::string reason) {
    return ConflictDecision{local.content, ConflictOutcome::LocalWins, both_changed, std::move(reason)};
}

ConflictDecision remote_wins(const NoteVersion& remote, bool both_changed, std::string reason) {
    return ConflictDecision{remote.content, ConflictOutcome::RemoteWins, both_changed, std::move(reason)};
}

ConflictDecision last_write_wins(const NoteVersion& local, const NoteVersion& remote) {
    if (local.modified_at > remote.modified_at) {
        return local_wins(local, true, "both changed; local edit is newer");
    }
    if (remote.modified_at > local.modified_at) {
        return remote_wins(remote, true, "both changed; vault edit is newer");
    }
    return ConflictDecision{
        .winning_content = {},
        .outcome = ConflictOutcome::Unresolvable,
        .both_changed = true,
        .reason = "both changed at the same instant"
    };
}

} // namespace

std::string_view to_string(ConflictOutcome outcome) noexcept {
    switch (outcome) {
        case ConflictOutcome::LocalWins: return "local_wins";
        case ConflictOutcome::RemoteWins: return "remote_wins";
        case ConflictOutcome::Merged: return "merged";
        case ConflictOutcome::Unresolvable: return "unresolvable";
    }
    return "unresolvable";
}

ConflictDecision resolve(const NoteVersion& local,
                         const NoteVersion& remote,
                         const Ancestor& ancestor,
                         ConflictStrategy strategy) {
    if (local.content_hash == remote.content_hash) {
        return local_wins(local, false, "contents identical");
    }

    if (!ancestor.content_hash) {
        // First sync of this note: nothing to tell which side moved.
        if (remote.modified_at > local.modified_at) {
            return remote_wins(remote, false, "first sync; vault copy is newer");
        }
        return local_wins(local, false, "first sync; local copy is newer or equal");
    }

    const bool local_changed = local.content_hash != *ancestor.content_hash;
    const bool remote_changed = remote.content_hash != *ancestor.content_hash;

    if (!remote_changed) {
        return local_wins(local, false, "only local changed");
    }
    if (!local_changed) {
        return remote_wins(remote, false, "only vault changed");
    }

    switch (strategy) {
        case ConflictStrategy::LocalWins:
            return local_wins(local, true, "both changed; vault policy keeps local");
        case ConflictStrategy::RemoteWins:
            return remote_wins(remote, true, "both changed; vault policy keeps vault copy");
        case ConflictStrategy::Merge:
            if (ancestor.content) {
                auto merged = merge_lines(*ancestor.content, local.content, remote.content);
                if (merged.clean()) {
                    return ConflictDecision{
                        .winning_content = std::move(merged.merged),
                        .outcome = ConflictOutcome::Merged,
                        .both_changed = true,
                        .reason = "both changed; edits merged"
                    };
                }
            }
            return last_write_wins(local, remote);
        case ConflictStrategy::LastWriteWins:
            break;
    }
    return last_write_wins(local, remote);
}

} // namespace vaultsync::sync
