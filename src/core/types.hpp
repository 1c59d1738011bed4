#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace atrium {

/**
 * Key - Local database identity of a mirrored entity, realm or block.
 */
using Key = int64_t;

/**
 * Timestamp - A point in time, stored as milliseconds since the Unix epoch.
 *
 * Mirrored entities use their source `updated` timestamp as revision marker,
 * so ordering of timestamps is the last-writer-wins order of the mirror.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    /**
     * Format as ISO 8601 string (UTC, millisecond precision).
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = static_cast<std::time_t>(millis_ / 1000);
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

/**
 * HarvestCursor - Opaque resumption token of the harvest protocol.
 *
 * An empty token means "from the beginning". Only the harvest client
 * interprets the token; everything else stores and passes it through.
 */
struct HarvestCursor {
    std::string token;

    [[nodiscard]] bool is_initial() const noexcept { return token.empty(); }

    bool operator==(const HarvestCursor&) const = default;
};

} // namespace atrium
