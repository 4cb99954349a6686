#include "sync/backoff.hpp"

namespace vaultsync::sync {

std::chrono::seconds BackoffPolicy::delay(int failures) const {
    if (failures <= 1 || base_.count() <= 0) {
        return base_;
    }
    auto delay = base_;
    for (int i = 1; i < failures; ++i) {
        // Stop doubling once at the cap so large counts cannot overflow.
        if (delay >= cap_ / 2) {
            return cap_;
        }
        delay *= 2;
    }
    return delay < cap_ ? delay : cap_;
}

} // namespace vaultsync::sync
