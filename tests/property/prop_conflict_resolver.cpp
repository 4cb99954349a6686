#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/content_hash.hpp"
#include "sync/conflict_resolver.hpp"

using namespace vaultsync;
using namespace vaultsync::sync;

namespace {

const Uuid NOTE_ID = Uuid::generate();

rc::Gen<std::string> gen_content() {
    return rc::gen::container<std::string>(rc::gen::elementOf(std::string("ab\n")));
}

// A single line; never contains '\n'.
rc::Gen<std::string> gen_line() {
    return rc::gen::nonEmpty(rc::gen::container<std::string>(rc::gen::elementOf(std::string("ab"))));
}

rc::Gen<int64_t> gen_millis() {
    return rc::gen::inRange<int64_t>(0, 1'000'000);
}

rc::Gen<ConflictStrategy> gen_strategy() {
    return rc::gen::element(ConflictStrategy::LastWriteWins, ConflictStrategy::LocalWins,
                            ConflictStrategy::RemoteWins, ConflictStrategy::Merge);
}

Ancestor ancestor_of(const std::string& content) {
    return Ancestor{content_hash(content), content};
}

} // namespace

TEST_CASE("Property: identical content always keeps local", "[property][conflict]") {
    init_hashing().unwrap();
    rc::check("same bytes on both sides resolve to LocalWins",
        []() {
            const auto content = *gen_content();
            const auto local = make_version(NOTE_ID, content, Timestamp(*gen_millis()));
            const auto remote = make_version(NOTE_ID, content, Timestamp(*gen_millis()));
            const auto ancestor = ancestor_of(*gen_content());

            auto decision = resolve(local, remote, ancestor, *gen_strategy());
            RC_ASSERT(decision.outcome == ConflictOutcome::LocalWins);
            RC_ASSERT(decision.winning_content == content);
            RC_ASSERT_FALSE(decision.both_changed);
            return true;
        }
    );
}

TEST_CASE("Property: the only changed side wins", "[property][conflict]") {
    init_hashing().unwrap();
    rc::check("one side equal to the ancestor never beats the other",
        []() {
            const auto base = *gen_content();
            const auto edited = *gen_content();
            RC_PRE(edited != base);
            const auto strategy = *gen_strategy();
            const Timestamp t1(*gen_millis());
            const Timestamp t2(*gen_millis());

            auto local_edit = resolve(make_version(NOTE_ID, edited, t1),
                                      make_version(NOTE_ID, base, t2),
                                      ancestor_of(base), strategy);
            RC_ASSERT(local_edit.outcome == ConflictOutcome::LocalWins);
            RC_ASSERT(local_edit.winning_content == edited);

            auto remote_edit = resolve(make_version(NOTE_ID, base, t1),
                                       make_version(NOTE_ID, edited, t2),
                                       ancestor_of(base), strategy);
            RC_ASSERT(remote_edit.outcome == ConflictOutcome::RemoteWins);
            RC_ASSERT(remote_edit.winning_content == edited);
            return true;
        }
    );
}

TEST_CASE("Property: last write wins picks the strictly later side", "[property][conflict]") {
    init_hashing().unwrap();
    rc::check("both changed under last-write-wins",
        []() {
            const auto base = *gen_content();
            const auto mine = *gen_content();
            const auto theirs = *gen_content();
            RC_PRE(mine != base && theirs != base && mine != theirs);
            const Timestamp t_local(*gen_millis());
            const Timestamp t_remote(*gen_millis());

            auto decision = resolve(make_version(NOTE_ID, mine, t_local),
                                    make_version(NOTE_ID, theirs, t_remote),
                                    ancestor_of(base), ConflictStrategy::LastWriteWins);
            RC_ASSERT(decision.both_changed);
            if (t_local > t_remote) {
                RC_ASSERT(decision.outcome == ConflictOutcome::LocalWins);
                RC_ASSERT(decision.winning_content == mine);
            } else if (t_remote > t_local) {
                RC_ASSERT(decision.outcome == ConflictOutcome::RemoteWins);
                RC_ASSERT(decision.winning_content == theirs);
            } else {
                RC_ASSERT(decision.outcome == ConflictOutcome::Unresolvable);
                RC_ASSERT(decision.winning_content.empty());
            }
            return true;
        }
    );
}

TEST_CASE("Property: resolve is deterministic", "[property][conflict]") {
    init_hashing().unwrap();
    rc::check("the same inputs give the same decision",
        []() {
            const auto local = make_version(NOTE_ID, *gen_content(), Timestamp(*gen_millis()));
            const auto remote = make_version(NOTE_ID, *gen_content(), Timestamp(*gen_millis()));
            const auto with_ancestor = *rc::gen::arbitrary<bool>();
            const auto ancestor = with_ancestor ? ancestor_of(*gen_content()) : Ancestor{};
            const auto strategy = *gen_strategy();

            RC_ASSERT(resolve(local, remote, ancestor, strategy) ==
                      resolve(local, remote, ancestor, strategy));
            return true;
        }
    );
}

TEST_CASE("Property: a clean merge keeps both sides' lines", "[property][conflict]") {
    init_hashing().unwrap();
    rc::check("appending on one side and prepending on the other merges",
        []() {
            const auto base = std::string("middle");
            const auto head = *gen_line();
            const auto tail = *gen_line();
            const auto mine = base + "\n" + tail;
            const auto theirs = head + "\n" + base;

            auto decision = resolve(make_version(NOTE_ID, mine, Timestamp(1)),
                                    make_version(NOTE_ID, theirs, Timestamp(2)),
                                    ancestor_of(base), ConflictStrategy::Merge);
            RC_ASSERT(decision.outcome == ConflictOutcome::Merged);
            RC_ASSERT(decision.winning_content == head + "\n" + base + "\n" + tail);
            return true;
        }
    );
}
