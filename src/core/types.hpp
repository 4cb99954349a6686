#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <optional>
#include <random>

namespace vaultsync {

/**
 * Uuid - 128-bit identifier for notes and vaults.
 *
 * Persisted as lowercase hyphenated text so rows stay readable with the
 * sqlite3 shell.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a random (version 4) UUID.
     */
    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes;
        for (size_t half = 0; half < 2; ++half) {
            uint64_t word = dist(gen);
            for (size_t i = 0; i < 8; ++i) {
                bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
            }
        }

        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;
        return Uuid(bytes);
    }

    /**
     * Parse hyphenated or plain hex form. Returns nullopt on malformed input.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch.
 *
 * All modification times, retry schedules and sync marks use this type so
 * comparisons are exact integer comparisons.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}
    explicit Timestamp(TimePoint tp) noexcept
        : millis_(tp.time_since_epoch().count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    /**
     * ISO 8601 in UTC with millisecond precision, e.g. 2024-01-15T09:30:00.000Z.
     */
    [[nodiscard]] std::string to_iso_string() const;

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    template<typename Rep, typename Period>
    Timestamp operator+(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(millis_ + std::chrono::duration_cast<Duration>(d).count());
    }

    template<typename Rep, typename Period>
    Timestamp operator-(std::chrono::duration<Rep, Period> d) const {
        return Timestamp(millis_ - std::chrono::duration_cast<Duration>(d).count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

} // namespace vaultsync

namespace std {
    template<>
    struct hash<vaultsync::Uuid> {
        size_t operator()(const vaultsync::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
