#pragma once

#include <string>
#include <string_view>

namespace vaultsync {

struct LineMerge {
    enum class Kind {
        Clean,     // Edits did not overlap; `merged` holds the combined text.
        Overlap,   // Both sides edited the same region; `merged` is empty.
        TooLarge   // Inputs exceed the diff budget; nothing was attempted.
    };

    Kind kind{Kind::Clean};
    std::string merged;

    [[nodiscard]] bool clean() const { return kind == Kind::Clean; }
};

// Deterministic line-based three-way merge of two edits of `ancestor`.
// Only a Clean result may be written anywhere: the caller falls back to a
// whole-version strategy for the other kinds.
[[nodiscard]] LineMerge merge_lines(std::string_view ancestor,
                                    std::string_view local,
                                    std::string_view remote);

} // namespace vaultsync
