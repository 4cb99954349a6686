#include <catch2/catch_test_macros.hpp>
#include "sync/conflict_resolver.hpp"

using namespace vaultsync;
using namespace vaultsync::sync;

namespace {

const Uuid NOTE_ID = Uuid::generate();

NoteVersion version(const std::string& content, int64_t modified_ms) {
    return make_version(NOTE_ID, content, Timestamp(modified_ms));
}

Ancestor ancestor_of(const std::string& content) {
    return Ancestor{content_hash(content), content};
}

} // namespace

TEST_CASE("Identical contents are never a conflict", "[resolver]") {
    auto d = resolve(version("same", 1'000), version("same", 5'000),
                     ancestor_of("old"), ConflictStrategy::LastWriteWins);

    REQUIRE(d.outcome == ConflictOutcome::LocalWins);
    REQUIRE_FALSE(d.both_changed);
    REQUIRE(d.winning_content == "same");
}

TEST_CASE("First sync picks the later side without conflict", "[resolver]") {
    const Ancestor none{};

    SECTION("Remote newer") {
        auto d = resolve(version("local", 1'000), version("remote", 2'000), none,
                         ConflictStrategy::LastWriteWins);
        REQUIRE(d.outcome == ConflictOutcome::RemoteWins);
        REQUIRE(d.winning_content == "remote");
        REQUIRE_FALSE(d.both_changed);
    }

    SECTION("Local newer") {
        auto d = resolve(version("local", 3'000), version("remote", 2'000), none,
                         ConflictStrategy::RemoteWins);
        REQUIRE(d.outcome == ConflictOutcome::LocalWins);
    }

    SECTION("Tie goes to local") {
        auto d = resolve(version("local", 2'000), version("remote", 2'000), none,
                         ConflictStrategy::LastWriteWins);
        REQUIRE(d.outcome == ConflictOutcome::LocalWins);
        REQUIRE(d.winning_content == "local");
    }
}

TEST_CASE("Only one side changed", "[resolver]") {
    const auto base = ancestor_of("base");

    SECTION("Only local changed wins even when older") {
        auto d = resolve(version("edited", 1'000), version("base", 9'000), base,
                         ConflictStrategy::LastWriteWins);
        REQUIRE(d.outcome == ConflictOutcome::LocalWins);
        REQUIRE_FALSE(d.both_changed);
        REQUIRE(d.winning_content == "edited");
    }

    SECTION("Only remote changed wins regardless of strategy") {
        auto d = resolve(version("base", 9'000), version("vault edit", 1'000), base,
                         ConflictStrategy::LocalWins);
        REQUIRE(d.outcome == ConflictOutcome::RemoteWins);
        REQUIRE(d.winning_content == "vault edit");
    }
}

TEST_CASE("Both changed under last-write-wins", "[resolver]") {
    const auto base = ancestor_of("base");

    SECTION("Strictly later remote wins") {
        auto d = resolve(version("local", 1'000), version("remote", 1'001), base,
                         ConflictStrategy::LastWriteWins);
        REQUIRE(d.outcome == ConflictOutcome::RemoteWins);
        REQUIRE(d.both_changed);
    }

    SECTION("Strictly later local wins") {
        auto d = resolve(version("local", 2'000), version("remote", 1'000), base,
                         ConflictStrategy::LastWriteWins);
        REQUIRE(d.outcome == ConflictOutcome::LocalWins);
        REQUIRE(d.both_changed);
    }

    SECTION("Equal timestamps cannot be decided") {
        auto d = resolve(version("local", 1'000), version("remote", 1'000), base,
                         ConflictStrategy::LastWriteWins);
        REQUIRE(d.outcome == ConflictOutcome::Unresolvable);
        REQUIRE(d.both_changed);
        REQUIRE(d.winning_content.empty());
        REQUIRE_FALSE(d.reason.empty());
    }
}

TEST_CASE("Both changed under fixed strategies", "[resolver]") {
    const auto base = ancestor_of("base");
    const auto local = version("local", 1'000);
    const auto remote = version("remote", 1'000);

    auto keep_local = resolve(local, remote, base, ConflictStrategy::LocalWins);
    REQUIRE(keep_local.outcome == ConflictOutcome::LocalWins);
    REQUIRE(keep_local.winning_content == "local");

    auto keep_remote = resolve(local, remote, base, ConflictStrategy::RemoteWins);
    REQUIRE(keep_remote.outcome == ConflictOutcome::RemoteWins);
    REQUIRE(keep_remote.winning_content == "remote");
}

TEST_CASE("Both changed under merge", "[resolver]") {
    const auto base = ancestor_of("one\ntwo\nthree");

    SECTION("Non-overlapping edits merge") {
        auto d = resolve(version("ONE\ntwo\nthree", 1'000), version("one\ntwo\nTHREE", 2'000),
                         base, ConflictStrategy::Merge);
        REQUIRE(d.outcome == ConflictOutcome::Merged);
        REQUIRE(d.winning_content == "ONE\ntwo\nTHREE");
        REQUIRE(d.both_changed);
    }

    SECTION("Overlapping edits fall back to last-write-wins") {
        auto d = resolve(version("one\nLOCAL\nthree", 1'000), version("one\nREMOTE\nthree", 2'000),
                         base, ConflictStrategy::Merge);
        REQUIRE(d.outcome == ConflictOutcome::RemoteWins);

        auto tie = resolve(version("one\nLOCAL\nthree", 2'000), version("one\nREMOTE\nthree", 2'000),
                           base, ConflictStrategy::Merge);
        REQUIRE(tie.outcome == ConflictOutcome::Unresolvable);
    }

    SECTION("Unknown ancestor content falls back to last-write-wins") {
        Ancestor hash_only{content_hash("one\ntwo\nthree"), std::nullopt};
        auto d = resolve(version("ONE\ntwo\nthree", 3'000), version("one\ntwo\nTHREE", 2'000),
                         hash_only, ConflictStrategy::Merge);
        REQUIRE(d.outcome == ConflictOutcome::LocalWins);
    }
}

TEST_CASE("Outcome names", "[resolver]") {
    REQUIRE(to_string(ConflictOutcome::Merged) == "merged");
    REQUIRE(to_string(ConflictOutcome::Unresolvable) == "unresolvable");
}
