#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <boost/date_time/local_time/local_time_types.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace vigil {

/// Daylight-saving aware time zone
///
/// Zones come from the system zoneinfo database by IANA name, or directly from
/// a POSIX TZ rule. In both cases the zone follows one recurring DST rule
/// (the current one), which is what alert schedules need.
class TimeZone {
public:
    using Ptr = std::shared_ptr<const TimeZone>;

    /// Resolve an IANA name ("America/New_York") from $TZDIR, else /usr/share/zoneinfo.
    /// Uses the TZ rule stored at the end of the TZif file. Results are cached.
    [[nodiscard]] static Result<Ptr, std::string> locate(const std::string& name);

    /// Build a zone from a POSIX TZ rule, e.g. "EST5EDT,M3.2.0,M11.1.0" or "<+03>-3".
    /// Offsets follow the TZ variable convention (positive west of Greenwich).
    [[nodiscard]] static Result<Ptr, std::string> from_posix_rule(std::string name, std::string_view rule);

    /// UTC offset in force at `at`, DST included
    [[nodiscard]] std::chrono::minutes offset_at(Timestamp at) const;

    [[nodiscard]] const std::string& name() const noexcept;

private:
    TimeZone(std::string name, boost::local_time::time_zone_ptr zone);

    std::string name_;
    boost::local_time::time_zone_ptr zone_;
};

}  // namespace vigil
