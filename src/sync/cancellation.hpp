#pragma once

#include <atomic>

namespace vaultsync::sync {

/**
 * CancellationToken - set by the host (scheduler stop, app shutdown),
 * polled by the sweep between notes.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace vaultsync::sync
