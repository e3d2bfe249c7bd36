#pragma once

/**
 * @file interval_series.h
 * @brief x-keyed series carrying an x- or y-interval per item.
 *
 * The payload is optional: an item added without an interval reads back NaN from
 * every numeric accessor.
 */

#include <chartdata/types/keyed_series.h>
#include <chartdata/types/paired_values.h>

#include <optional>
#include <string>

namespace chartdata {

/**
 * @brief A list of (x, y, y-low, y-high) items.
 *
 * By default items are sorted by x and duplicate x-values are allowed.
 */
class YIntervalSeries : public KeyedSeries<double, std::optional<YInterval>> {
public:
    explicit YIntervalSeries(std::string name, SeriesConfig config = {true, true})
        : KeyedSeries(std::move(name), config) {}

    using KeyedSeries::add;

    void add(double x, double y, double y_low, double y_high, bool notify = true) {
        add(x, YInterval{y, y_low, y_high}, notify);
    }

    [[nodiscard]] double x(size_t index) const { return key_at(index); }
    [[nodiscard]] double y_value(size_t index) const { return field_or_missing(value_at(index), &YInterval::y); }
    [[nodiscard]] double y_low_value(size_t index) const { return field_or_missing(value_at(index), &YInterval::y_low); }
    [[nodiscard]] double y_high_value(size_t index) const { return field_or_missing(value_at(index), &YInterval::y_high); }
};

/**
 * @brief A list of (x, x-low, x-high, y) items.
 *
 * By default items are sorted by x and duplicate x-values are allowed.
 */
class XIntervalSeries : public KeyedSeries<double, std::optional<XInterval>> {
public:
    explicit XIntervalSeries(std::string name, SeriesConfig config = {true, true})
        : KeyedSeries(std::move(name), config) {}

    using KeyedSeries::add;

    void add(double x, double x_low, double x_high, double y, bool notify = true) {
        add(x, XInterval{x_low, x_high, y}, notify);
    }

    [[nodiscard]] double x(size_t index) const { return key_at(index); }
    [[nodiscard]] double x_low_value(size_t index) const { return field_or_missing(value_at(index), &XInterval::x_low); }
    [[nodiscard]] double x_high_value(size_t index) const { return field_or_missing(value_at(index), &XInterval::x_high); }
    [[nodiscard]] double y_value(size_t index) const { return field_or_missing(value_at(index), &XInterval::y); }
};

} // namespace chartdata
