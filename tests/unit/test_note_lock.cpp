#include <catch2/catch_test_macros.hpp>
#include "sync/note_lock.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace vaultsync;
using vaultsync::sync::NoteLockTable;

TEST_CASE("NoteLockTable drops entries when released", "[note_lock]") {
    NoteLockTable locks;
    const auto a = Uuid::generate();
    const auto b = Uuid::generate();

    {
        auto guard_a = locks.lock(a);
        auto guard_b = locks.lock(b);
        REQUIRE(locks.size() == 2);
    }
    REQUIRE(locks.size() == 0);
}

TEST_CASE("NoteLockTable serializes work on one note", "[note_lock]") {
    NoteLockTable locks;
    const auto note = Uuid::generate();

    std::atomic<int> inside{0};
    std::atomic<bool> overlapped{false};
    int counter = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                auto guard = locks.lock(note);
                if (inside.fetch_add(1) != 0) {
                    overlapped = true;
                }
                ++counter;
                inside.fetch_sub(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE_FALSE(overlapped.load());
    REQUIRE(counter == 8 * 200);
    REQUIRE(locks.size() == 0);
}

TEST_CASE("NoteLockTable does not block other notes", "[note_lock]") {
    NoteLockTable locks;
    const auto held = Uuid::generate();
    auto guard = locks.lock(held);

    std::atomic<bool> done{false};
    std::thread other([&] {
        auto g = locks.lock(Uuid::generate());
        done = true;
    });
    other.join();

    REQUIRE(done.load());
    REQUIRE(locks.size() == 1);
}
