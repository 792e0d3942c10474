#include "core/time_zone.hpp"
#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/conversion.hpp>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <unordered_map>
#include <utility>

namespace vigil {

namespace {

constexpr long kSecondsPerDay = 86400;

/// Cursor over a POSIX TZ rule
struct RuleReader {
    std::string_view text;
    std::size_t pos{0};

    [[nodiscard]] bool done() const noexcept { return pos >= text.size(); }
    [[nodiscard]] char peek() const noexcept { return text[pos]; }
};

bool is_alpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/// Zone abbreviation: 3+ letters, or anything inside <...>
std::optional<std::string> read_abbrev(RuleReader& reader) {
    if (reader.done()) {
        return std::nullopt;
    }
    if (reader.peek() == '<') {
        const auto close = reader.text.find('>', reader.pos);
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        std::string quoted(reader.text.substr(reader.pos + 1, close - reader.pos - 1));
        reader.pos = close + 1;
        return quoted;
    }
    const auto start = reader.pos;
    while (!reader.done() && is_alpha(reader.peek())) {
        ++reader.pos;
    }
    if (reader.pos - start < 3) {
        return std::nullopt;
    }
    return std::string(reader.text.substr(start, reader.pos - start));
}

/// [+|-]hh[:mm[:ss]] in seconds
std::optional<long> read_offset(RuleReader& reader) {
    long sign = 1;
    if (!reader.done() && (reader.peek() == '+' || reader.peek() == '-')) {
        sign = reader.peek() == '-' ? -1 : 1;
        ++reader.pos;
    }

    static constexpr long kUnits[] = {3600, 60, 1};
    long total = 0;
    for (std::size_t part = 0; part < 3; ++part) {
        if (part > 0) {
            if (reader.done() || reader.peek() != ':') {
                break;
            }
            ++reader.pos;
        }
        const auto start = reader.pos;
        long value = 0;
        while (!reader.done() && is_digit(reader.peek())) {
            value = value * 10 + (reader.peek() - '0');
            ++reader.pos;
        }
        if (reader.pos == start || reader.pos - start > 3) {
            return std::nullopt;
        }
        total += value * kUnits[part];
    }
    return sign * total;
}

/// Duration in Boost's delimited form: [-]hh:mm:ss
std::string boost_duration(long seconds) {
    const char* sign = seconds < 0 ? "-" : "";
    seconds = std::labs(seconds);
    return fmt::format("{}{:02}:{:02}:{:02}", sign, seconds / 3600, (seconds / 60) % 60, seconds % 60);
}

/// Boost only reads alphabetic abbreviations
std::string boost_abbrev(const std::string& abbrev, const char* placeholder) {
    for (char c : abbrev) {
        if (!is_alpha(c)) {
            return placeholder;
        }
    }
    return abbrev;
}

/// Boost takes each transition time as a time of day on the transition date
bool transition_times_supported(std::string_view rules) {
    std::size_t pos = 0;
    while ((pos = rules.find('/', pos)) != std::string_view::npos) {
        RuleReader reader{rules, pos + 1};
        auto time = read_offset(reader);
        if (!time || *time < 0 || *time >= kSecondsPerDay) {
            return false;
        }
        pos = reader.pos;
    }
    return true;
}

/// Translate a POSIX TZ rule into Boost's posix_time_zone dialect: offsets
/// positive east of UTC, the DST offset given as an adjustment to standard time
Result<std::string, std::string> to_boost_rule(std::string_view rule) {
    using R = Result<std::string, std::string>;
    const std::string quoted = "'" + std::string(rule) + "'";

    RuleReader reader{rule};
    auto std_name = read_abbrev(reader);
    auto std_offset = std_name ? read_offset(reader) : std::nullopt;
    if (!std_name || !std_offset) {
        return R::Err("invalid standard time in TZ rule " + quoted);
    }

    std::string out = boost_abbrev(*std_name, "STD") + boost_duration(-*std_offset);
    if (reader.done()) {
        return R::Ok(std::move(out));
    }

    auto dst_name = read_abbrev(reader);
    if (!dst_name) {
        return R::Err("invalid daylight time in TZ rule " + quoted);
    }
    long dst_offset = *std_offset - 3600;
    if (!reader.done() && reader.peek() != ',') {
        auto parsed = read_offset(reader);
        if (!parsed) {
            return R::Err("invalid daylight offset in TZ rule " + quoted);
        }
        dst_offset = *parsed;
    }

    if (reader.done() || reader.peek() != ',') {
        return R::Err("TZ rule " + quoted + " has daylight time but no transition dates");
    }
    const auto transitions = rule.substr(reader.pos);
    if (!transition_times_supported(transitions)) {
        return R::Err("TZ rule " + quoted + " uses transition times outside 00:00-24:00");
    }

    out += boost_abbrev(*dst_name, "DST") + boost_duration(*std_offset - dst_offset);
    out += transitions;
    return R::Ok(std::move(out));
}

/// IANA names are relative paths made of letters, digits, '_', '-', '+' and '/'
bool valid_zone_name(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.find("..") != std::string::npos) {
        return false;
    }
    for (char c : name) {
        if (!is_alpha(c) && !is_digit(c) && c != '_' && c != '-' && c != '+' && c != '/') {
            return false;
        }
    }
    return true;
}

std::string zoneinfo_dir() {
    const char* dir = std::getenv("TZDIR");
    return (dir != nullptr && *dir != '\0') ? dir : "/usr/share/zoneinfo";
}

/// The TZ rule a TZif v2+ file carries on its last line
Result<std::string, std::string> read_tzif_rule(const std::string& path) {
    using R = Result<std::string, std::string>;

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return R::Err("Unknown time zone: no file " + path);
    }
    std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    if (data.size() < 5 || data.compare(0, 4, "TZif") != 0 || data[4] < '2') {
        return R::Err("Not a TZif v2+ file: " + path);
    }
    if (data.back() != '\n') {
        return R::Err("TZif file has no TZ rule: " + path);
    }
    const auto start = data.rfind('\n', data.size() - 2);
    if (start == std::string::npos || start + 2 >= data.size()) {
        return R::Err("TZif file has no TZ rule: " + path);
    }
    return R::Ok(data.substr(start + 1, data.size() - start - 2));
}

}  // namespace

TimeZone::TimeZone(std::string name, boost::local_time::time_zone_ptr zone)
    : name_(std::move(name))
    , zone_(std::move(zone))
{}

Result<TimeZone::Ptr, std::string> TimeZone::locate(const std::string& name) {
    using R = Result<Ptr, std::string>;

    static std::mutex cache_mutex;
    static std::unordered_map<std::string, Ptr> cache;

    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        auto it = cache.find(name);
        if (it != cache.end()) {
            return R::Ok(it->second);
        }
    }

    if (!valid_zone_name(name)) {
        return R::Err("Invalid time zone name: " + name);
    }

    auto zone = read_tzif_rule(zoneinfo_dir() + "/" + name)
        .and_then([&name](const std::string& rule) {
            return from_posix_rule(name, rule);
        });

    if (zone.is_ok()) {
        std::lock_guard<std::mutex> lock(cache_mutex);
        cache.emplace(name, zone.value());
    }
    return zone;
}

Result<TimeZone::Ptr, std::string> TimeZone::from_posix_rule(std::string name, std::string_view rule) {
    using R = Result<Ptr, std::string>;

    auto boost_rule = to_boost_rule(rule);
    if (boost_rule.is_err()) {
        return R::Err(boost_rule.error());
    }

    try {
        auto zone = boost::local_time::time_zone_ptr(
            new boost::local_time::posix_time_zone(boost_rule.value()));
        return R::Ok(Ptr(new TimeZone(std::move(name), std::move(zone))));
    } catch (const std::exception& e) {
        return R::Err("Rejected TZ rule '" + std::string(rule) + "': " + e.what());
    }
}

std::chrono::minutes TimeZone::offset_at(Timestamp at) const {
    namespace pt = boost::posix_time;

    const auto secs = std::chrono::floor<std::chrono::seconds>(at).time_since_epoch().count();
    const pt::ptime utc = pt::from_time_t(static_cast<std::time_t>(secs));
    const boost::local_time::local_date_time local(utc, zone_);
    return std::chrono::minutes((local.local_time() - utc).total_seconds() / 60);
}

const std::string& TimeZone::name() const noexcept {
    return name_;
}

}  // namespace vigil
