#pragma once

/**
 * @file vector_series.h
 * @brief VectorSeries - vectors (dx, dy) anchored at (x, y) coordinates.
 */

#include <chartdata/types/format.h>
#include <chartdata/types/keyed_series.h>
#include <chartdata/types/paired_values.h>

#include <optional>
#include <string>

namespace chartdata {

/**
 * @brief A list of (x, y, dx, dy) items keyed by their (x, y) coordinate.
 *
 * By default items keep insertion order and duplicate coordinates are allowed.
 */
class VectorSeries : public KeyedSeries<XYCoordinate, std::optional<Vector>> {
public:
    explicit VectorSeries(std::string name, SeriesConfig config = {false, true})
        : KeyedSeries(std::move(name), config) {}

    using KeyedSeries::add;

    void add(double x, double y, double dx, double dy, bool notify = true) {
        add(XYCoordinate{x, y}, Vector{dx, dy}, notify);
    }

    [[nodiscard]] double x_value(size_t index) const { return key_at(index).x; }
    [[nodiscard]] double y_value(size_t index) const { return key_at(index).y; }
    [[nodiscard]] double vector_x(size_t index) const { return field_or_missing(value_at(index), &Vector::x); }
    [[nodiscard]] double vector_y(size_t index) const { return field_or_missing(value_at(index), &Vector::y); }
};

} // namespace chartdata
