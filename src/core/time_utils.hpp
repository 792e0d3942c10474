#pragma once

#include "core/types.hpp"
#include <chrono>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace vigil {

/// Wall-clock time of day at minute resolution ("HH:MM")
struct TimeOfDay {
    int hour{0};
    int minute{0};

    constexpr auto operator<=>(const TimeOfDay&) const = default;
};

/// Local calendar view of an instant
struct LocalTime {
    int weekday{0};  // 0 = Sunday ... 6 = Saturday
    TimeOfDay time;
};

/// Parse "HH:MM" (24h). Returns nullopt for anything else.
[[nodiscard]] std::optional<TimeOfDay> parse_time_of_day(std::string_view text);

/// Project an absolute instant onto the wall clock of a fixed UTC offset
[[nodiscard]] LocalTime to_local_time(Timestamp at, std::chrono::minutes utc_offset);

/// Half-open span [begin, end) of one local calendar day
struct DayWindow {
    Timestamp begin;
    Timestamp end;

    [[nodiscard]] constexpr bool contains(Timestamp at) const noexcept {
        return at >= begin && at < end;
    }
};

/// The 24h day containing `at`, midnight to midnight in a fixed UTC offset
[[nodiscard]] DayWindow day_window(Timestamp at, std::chrono::minutes utc_offset);

/// Format as ISO8601 UTC with millisecond precision: 2024-01-20T09:15:00.000Z
[[nodiscard]] std::string format_iso8601(Timestamp at);

/// Parse ISO8601: "YYYY-MM-DDTHH:MM:SS", optional ".fff", then "Z" or "+HH:MM"/"-HH:MM".
/// A missing zone designator is read as UTC.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

}  // namespace vigil
