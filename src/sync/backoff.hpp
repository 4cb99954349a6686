#pragma once

#include <chrono>

namespace vaultsync::sync {

/**
 * BackoffPolicy - delay before the next attempt after n failures.
 *
 *   delay(0) = base
 *   delay(n) = min(cap, base * 2^(n-1))
 *
 * Monotone non-decreasing in n and never above cap.
 */
class BackoffPolicy {
public:
    static constexpr std::chrono::seconds DEFAULT_BASE{30};
    static constexpr std::chrono::seconds DEFAULT_CAP{3600};

    constexpr BackoffPolicy() = default;
    constexpr BackoffPolicy(std::chrono::seconds base, std::chrono::seconds cap)
        : base_(base), cap_(cap < base ? base : cap) {}

    [[nodiscard]] std::chrono::seconds delay(int failures) const;

    [[nodiscard]] constexpr std::chrono::seconds base() const { return base_; }
    [[nodiscard]] constexpr std::chrono::seconds cap() const { return cap_; }

private:
    std::chrono::seconds base_{DEFAULT_BASE};
    std::chrono::seconds cap_{DEFAULT_CAP};
};

} // namespace vaultsync::sync
