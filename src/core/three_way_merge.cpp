#include "core/three_way_merge.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace vaultsync {
namespace {

using Lines = std::vector<std::string>;

// Upper bound on LCS table cells (ints) per side, roughly 8 MB.
constexpr size_t CELL_LIMIT = 2'000'000;

Lines split_lines(std::string_view text) {
    Lines out;
    std::string current;
    for (const char c : text) {
        if (c == '\r') continue;
        if (c == '\n') {
            out.push_back(std::move(current));
            current = {};
            continue;
        }
        current.push_back(c);
    }
    out.push_back(std::move(current));
    return out;
}

std::string join_lines(const Lines& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

// Edits of one side against the ancestor: lines inserted before each
// ancestor line (plus one trailing slot) and which ancestor lines were dropped.
struct SideEdits {
    std::vector<Lines> inserts;
    std::vector<bool> deletes;
};

SideEdits diff_against(const Lines& base, const Lines& side) {
    const auto n = base.size();
    const auto m = side.size();

    SideEdits edits{
        .inserts = std::vector<Lines>(n + 1),
        .deletes = std::vector<bool>(n, false),
    };

    std::vector<int> lcs((n + 1) * (m + 1), 0);
    const auto at = [&](size_t i, size_t j) -> int& { return lcs[i * (m + 1) + j]; };

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < m; ++j) {
            at(i + 1, j + 1) = base[i] == side[j]
                ? at(i, j) + 1
                : std::max(at(i, j + 1), at(i + 1, j));
        }
    }

    size_t i = n;
    size_t j = m;
    while (i > 0 || j > 0) {
        if (i > 0 && j > 0 && base[i - 1] == side[j - 1]) {
            --i;
            --j;
        } else if (j > 0 && (i == 0 || at(i, j - 1) >= at(i - 1, j))) {
            edits.inserts[i].push_back(side[j - 1]);
            --j;
        } else {
            edits.deletes[i - 1] = true;
            --i;
        }
    }

    for (auto& bucket : edits.inserts) {
        std::reverse(bucket.begin(), bucket.end());
    }
    return edits;
}

// Combine the insertions both sides made at the same slot.
// Returns false when they differ and neither side is empty.
bool combine_inserts(const Lines& local, const Lines& remote, Lines& out) {
    if (remote.empty() || local == remote) {
        out.insert(out.end(), local.begin(), local.end());
        return true;
    }
    if (local.empty()) {
        out.insert(out.end(), remote.begin(), remote.end());
        return true;
    }
    return false;
}

} // namespace

LineMerge merge_lines(std::string_view ancestor,
                      std::string_view local,
                      std::string_view remote) {
    if (local == remote || remote == ancestor) {
        return LineMerge{LineMerge::Kind::Clean, std::string(local)};
    }
    if (local == ancestor) {
        return LineMerge{LineMerge::Kind::Clean, std::string(remote)};
    }

    const auto base = split_lines(ancestor);
    const auto ours = split_lines(local);
    const auto theirs = split_lines(remote);

    if ((base.size() + 1) * (ours.size() + 1) > CELL_LIMIT ||
        (base.size() + 1) * (theirs.size() + 1) > CELL_LIMIT) {
        return LineMerge{LineMerge::Kind::TooLarge, {}};
    }

    const auto ours_edits = diff_against(base, ours);
    const auto theirs_edits = diff_against(base, theirs);

    Lines merged;
    merged.reserve(std::max({base.size(), ours.size(), theirs.size()}) + 8);

    for (size_t i = 0; i <= base.size(); ++i) {
        if (!combine_inserts(ours_edits.inserts[i], theirs_edits.inserts[i], merged)) {
            return LineMerge{LineMerge::Kind::Overlap, {}};
        }
        if (i == base.size()) break;

        const bool ours_deleted = ours_edits.deletes[i];
        const bool theirs_deleted = theirs_edits.deletes[i];
        // A line rewritten on one side and deleted on the other is an overlap.
        if (ours_deleted != theirs_deleted) {
            const auto& other_inserts = ours_deleted ? theirs_edits.inserts : ours_edits.inserts;
            if (!other_inserts[i].empty() || !other_inserts[i + 1].empty()) {
                return LineMerge{LineMerge::Kind::Overlap, {}};
            }
        }
        if (!ours_deleted && !theirs_deleted) {
            merged.push_back(base[i]);
        }
    }

    return LineMerge{LineMerge::Kind::Clean, join_lines(merged)};
}

} // namespace vaultsync
