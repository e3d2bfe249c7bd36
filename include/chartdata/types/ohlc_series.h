#pragma once

/**
 * @file ohlc_series.h
 * @brief OHLCSeries - open/high/low/close prices keyed by period start.
 */

#include <chartdata/types/keyed_series.h>
#include <chartdata/types/paired_values.h>
#include <chartdata/util/date_time.h>

#include <optional>
#include <string>

namespace chartdata {

/**
 * @brief A list of (period, open, high, low, close) items.
 *
 * By default items are sorted by period and a period may appear only once.
 */
class OHLCSeries : public KeyedSeries<chart_time_t, std::optional<OHLC>> {
public:
    explicit OHLCSeries(std::string name, SeriesConfig config = {true, false})
        : KeyedSeries(std::move(name), config) {}

    using KeyedSeries::add;

    void add(chart_time_t period, double open, double high, double low, double close, bool notify = true) {
        add(period, OHLC{open, high, low, close}, notify);
    }

    [[nodiscard]] chart_time_t period(size_t index) const { return key_at(index); }
    [[nodiscard]] double open_value(size_t index) const { return field_or_missing(value_at(index), &OHLC::open); }
    [[nodiscard]] double high_value(size_t index) const { return field_or_missing(value_at(index), &OHLC::high); }
    [[nodiscard]] double low_value(size_t index) const { return field_or_missing(value_at(index), &OHLC::low); }
    [[nodiscard]] double close_value(size_t index) const { return field_or_missing(value_at(index), &OHLC::close); }

    // The y-value of an OHLC item is its close.
    [[nodiscard]] double y_value(size_t index) const { return close_value(index); }
};

} // namespace chartdata
