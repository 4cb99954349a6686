#pragma once

#include "core/types.hpp"

namespace vaultsync {

/**
 * Clock - source of "now" for everything that schedules or stamps records.
 *
 * The coordinator and the sweep take a Clock& so retry schedules can be
 * driven deterministically in tests.
 */
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override { return Timestamp::now(); }
};

} // namespace vaultsync
