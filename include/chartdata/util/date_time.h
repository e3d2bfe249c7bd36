//
// Clock types used for time-period keyed series.
//

#ifndef CHARTDATA_DATE_TIME_H
#define CHARTDATA_DATE_TIME_H

#include <chrono>

namespace chartdata {
    using chart_clock = std::chrono::system_clock;
    // Use microsecond precision to avoid overflow for dates beyond 2262
    using chart_time_t = std::chrono::time_point<chart_clock, std::chrono::microseconds>;
    using chart_date_t = std::chrono::year_month_day;

    /**
     * The start of the given calendar day (UTC), the usual key for a daily OHLC bar.
     */
    constexpr chart_time_t day_start(chart_date_t date) noexcept {
        return chart_time_t{std::chrono::sys_days{date}.time_since_epoch()};
    }
} // namespace chartdata
#endif  // CHARTDATA_DATE_TIME_H
