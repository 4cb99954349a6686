#include <catch2/catch_test_macros.hpp>
#include "sync/backoff.hpp"

using namespace std::chrono_literals;
using vaultsync::sync::BackoffPolicy;

TEST_CASE("Default backoff doubles from 30 s up to an hour", "[backoff]") {
    const BackoffPolicy policy;

    REQUIRE(policy.delay(0) == 30s);
    REQUIRE(policy.delay(1) == 30s);
    REQUIRE(policy.delay(2) == 60s);
    REQUIRE(policy.delay(3) == 120s);
    REQUIRE(policy.delay(7) == 1920s);
    REQUIRE(policy.delay(8) == 3600s);
    REQUIRE(policy.delay(50) == 3600s);
    REQUIRE(policy.delay(1'000'000) == 3600s);
}

TEST_CASE("Custom backoff bounds", "[backoff]") {
    const BackoffPolicy policy(5s, 17s);

    REQUIRE(policy.delay(1) == 5s);
    REQUIRE(policy.delay(2) == 10s);
    REQUIRE(policy.delay(3) == 17s);
    REQUIRE(policy.delay(4) == 17s);

    SECTION("Cap below base is raised to base") {
        const BackoffPolicy flat(40s, 10s);
        REQUIRE(flat.cap() == 40s);
        REQUIRE(flat.delay(6) == 40s);
    }

    SECTION("Zero base stays zero") {
        const BackoffPolicy none(0s, 0s);
        REQUIRE(none.delay(10) == 0s);
    }
}
