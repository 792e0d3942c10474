#include "core/time_utils.hpp"
#include <charconv>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace vigil {

namespace {

using namespace std::chrono;

constexpr std::int64_t kSecondsPerDay = 86400;

/// Floor division (C++ integer division truncates toward zero)
constexpr std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

/// Days since 1970-01-01 for a proleptic Gregorian date
constexpr std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = floor_div(y, 400);
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct CivilDate {
    std::int64_t year;
    unsigned month;
    unsigned day;
};

constexpr CivilDate civil_from_days(std::int64_t z) {
    z += 719468;
    const std::int64_t era = floor_div(z, 146097);
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{y + (m <= 2 ? 1 : 0), m, d};
}

/// Read exactly `width` decimal digits at `pos`
std::optional<int> read_digits(std::string_view text, std::size_t pos, std::size_t width) {
    if (pos + width > text.size() || text[pos] < '0' || text[pos] > '9') {
        return std::nullopt;
    }
    int value = 0;
    const char* first = text.data() + pos;
    const char* last = first + width;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

bool expect_char(std::string_view text, std::size_t pos, char c) {
    return pos < text.size() && text[pos] == c;
}

}  // namespace

std::optional<TimeOfDay> parse_time_of_day(std::string_view text) {
    if (text.size() != 5 || text[2] != ':') {
        return std::nullopt;
    }
    auto hour = read_digits(text, 0, 2);
    auto minute = read_digits(text, 3, 2);
    if (!hour || !minute || *hour > 23 || *minute > 59) {
        return std::nullopt;
    }
    return TimeOfDay{*hour, *minute};
}

LocalTime to_local_time(Timestamp at, std::chrono::minutes utc_offset) {
    const auto secs = duration_cast<seconds>(at.time_since_epoch() + utc_offset).count();
    const std::int64_t days = floor_div(secs, kSecondsPerDay);
    const std::int64_t secs_of_day = secs - days * kSecondsPerDay;

    // 1970-01-01 was a Thursday
    const auto weekday = static_cast<int>((days + 4) - floor_div(days + 4, 7) * 7);

    LocalTime local;
    local.weekday = weekday;
    local.time.hour = static_cast<int>(secs_of_day / 3600);
    local.time.minute = static_cast<int>((secs_of_day % 3600) / 60);
    return local;
}

DayWindow day_window(Timestamp at, std::chrono::minutes utc_offset) {
    const auto secs = duration_cast<seconds>(at.time_since_epoch() + utc_offset).count();
    const std::int64_t days = floor_div(secs, kSecondsPerDay);
    const Timestamp begin{seconds{days * kSecondsPerDay} - utc_offset};
    return DayWindow{begin, begin + hours{24}};
}

std::string format_iso8601(Timestamp at) {
    const auto ms_total = duration_cast<milliseconds>(at.time_since_epoch()).count();
    const std::int64_t days = floor_div(ms_total, kSecondsPerDay * 1000);
    const std::int64_t ms_of_day = ms_total - days * kSecondsPerDay * 1000;
    const CivilDate date = civil_from_days(days);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << date.year << '-'
        << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day << 'T'
        << std::setw(2) << (ms_of_day / 3600000) << ':'
        << std::setw(2) << (ms_of_day / 60000) % 60 << ':'
        << std::setw(2) << (ms_of_day / 1000) % 60 << '.'
        << std::setw(3) << ms_of_day % 1000 << 'Z';
    return oss.str();
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS
    auto year = read_digits(text, 0, 4);
    auto month = read_digits(text, 5, 2);
    auto day = read_digits(text, 8, 2);
    auto hour = read_digits(text, 11, 2);
    auto minute = read_digits(text, 14, 2);
    auto second = read_digits(text, 17, 2);
    if (!year || !month || !day || !hour || !minute || !second ||
        !expect_char(text, 4, '-') || !expect_char(text, 7, '-') ||
        !(expect_char(text, 10, 'T') || expect_char(text, 10, ' ')) ||
        !expect_char(text, 13, ':') || !expect_char(text, 16, ':')) {
        return std::nullopt;
    }
    if (*month < 1 || *month > 12 || *day < 1 || *day > 31 ||
        *hour > 23 || *minute > 59 || *second > 60) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::int64_t millis = 0;
    if (expect_char(text, pos, '.')) {
        ++pos;
        int scale = 100;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            millis += (text[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
    }

    std::int64_t offset_minutes = 0;
    if (pos < text.size()) {
        if (text[pos] == 'Z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            const int sign = text[pos] == '-' ? -1 : 1;
            auto off_h = read_digits(text, pos + 1, 2);
            auto off_m = read_digits(text, pos + 4, 2);
            if (!off_h || !off_m || !expect_char(text, pos + 3, ':')) {
                return std::nullopt;
            }
            offset_minutes = sign * (*off_h * 60 + *off_m);
            pos += 6;
        }
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    const std::int64_t days = days_from_civil(*year, static_cast<unsigned>(*month),
                                              static_cast<unsigned>(*day));
    // Day past the end of its month (2024-02-30) lands in the next one
    const CivilDate check = civil_from_days(days);
    if (check.month != static_cast<unsigned>(*month) || check.day != static_cast<unsigned>(*day)) {
        return std::nullopt;
    }
    const std::int64_t secs = days * kSecondsPerDay + *hour * 3600 + *minute * 60 + *second
                            - offset_minutes * 60;
    return Timestamp{duration_cast<Timestamp::duration>(seconds{secs} + milliseconds{millis})};
}

}  // namespace vigil
