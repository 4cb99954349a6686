#include "core/types.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace vaultsync {

// Both types are bound into SQLite rows by value; keep them plain.
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(sizeof(Timestamp) == sizeof(int64_t), "Timestamp should wrap a single int64");

namespace {

constexpr size_t HEX_DIGITS = Uuid::BYTE_SIZE * 2;

bool is_hyphen_position(size_t byte_index) {
    return byte_index == 4 || byte_index == 6 || byte_index == 8 || byte_index == 10;
}

} // namespace

std::optional<Uuid> Uuid::parse(std::string_view str) {
    std::string clean;
    clean.reserve(HEX_DIGITS);
    for (const char c : str) {
        if (c != '-') clean += c;
    }
    if (clean.size() != HEX_DIGITS) return std::nullopt;

    Bytes bytes;
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        const char* first = clean.data() + i * 2;
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(first, first + 2, value, 16);
        if (ec != std::errc{} || ptr != first + 2) {
            return std::nullopt;
        }
        bytes[i] = static_cast<uint8_t>(value);
    }
    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < BYTE_SIZE; ++i) {
        if (is_hyphen_position(i)) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes_[i]);
    }
    return oss.str();
}

std::string Timestamp::to_iso_string() const {
    // Floor toward negative infinity so pre-epoch times keep a 0..999 fraction.
    int64_t seconds = millis_ / 1000;
    int64_t fraction = millis_ % 1000;
    if (fraction < 0) {
        fraction += 1000;
        seconds -= 1;
    }

    const auto time_t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << fraction << 'Z';
    return oss.str();
}

} // namespace vaultsync
