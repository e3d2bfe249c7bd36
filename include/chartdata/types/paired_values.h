#pragma once

/**
 * @file paired_values.h
 * @brief Immutable payload records carried by series items.
 *
 * Each record is the value half of a series entry: the key (an x-value, a coordinate or a
 * time period) lives in the entry, the numbers paired with it live here.
 *
 * Equality compares the raw IEEE-754 bit pattern of every field. This is stricter than
 * operator== on double: NaN equals NaN only when both carry the same payload bits, and
 * 0.0 differs from -0.0.
 */

#include <bit>
#include <compare>
#include <cstdint>
#include <limits>
#include <optional>

namespace chartdata {

// Read-side sentinel for an absent value.
inline constexpr double MISSING_VALUE = std::numeric_limits<double>::quiet_NaN();

[[nodiscard]] constexpr bool same_bits(double a, double b) noexcept {
    return std::bit_cast<uint64_t>(a) == std::bit_cast<uint64_t>(b);
}

/**
 * @brief The (dx, dy) components of a vector anchored at a coordinate.
 */
class Vector {
public:
    constexpr Vector(double x, double y) noexcept : x_(x), y_(y) {}

    [[nodiscard]] constexpr double x() const noexcept { return x_; }
    [[nodiscard]] constexpr double y() const noexcept { return y_; }

    friend constexpr bool operator==(const Vector& a, const Vector& b) noexcept {
        return same_bits(a.x_, b.x_) && same_bits(a.y_, b.y_);
    }

private:
    double x_;
    double y_;
};

/**
 * @brief An x-interval [x_low, x_high] with its y-value.
 */
class XInterval {
public:
    constexpr XInterval(double x_low, double x_high, double y) noexcept
        : x_low_(x_low), x_high_(x_high), y_(y) {}

    [[nodiscard]] constexpr double x_low() const noexcept { return x_low_; }
    [[nodiscard]] constexpr double x_high() const noexcept { return x_high_; }
    [[nodiscard]] constexpr double y() const noexcept { return y_; }

    friend constexpr bool operator==(const XInterval& a, const XInterval& b) noexcept {
        return same_bits(a.x_low_, b.x_low_) && same_bits(a.x_high_, b.x_high_) && same_bits(a.y_, b.y_);
    }

private:
    double x_low_;
    double x_high_;
    double y_;
};

/**
 * @brief A y-value with the bounds of its interval.
 */
class YInterval {
public:
    constexpr YInterval(double y, double y_low, double y_high) noexcept
        : y_(y), y_low_(y_low), y_high_(y_high) {}

    [[nodiscard]] constexpr double y() const noexcept { return y_; }
    [[nodiscard]] constexpr double y_low() const noexcept { return y_low_; }
    [[nodiscard]] constexpr double y_high() const noexcept { return y_high_; }

    friend constexpr bool operator==(const YInterval& a, const YInterval& b) noexcept {
        return same_bits(a.y_, b.y_) && same_bits(a.y_low_, b.y_low_) && same_bits(a.y_high_, b.y_high_);
    }

private:
    double y_;
    double y_low_;
    double y_high_;
};

/**
 * @brief Open-high-low-close prices for one period.
 */
class OHLC {
public:
    constexpr OHLC(double open, double high, double low, double close) noexcept
        : open_(open), high_(high), low_(low), close_(close) {}

    [[nodiscard]] constexpr double open() const noexcept { return open_; }
    [[nodiscard]] constexpr double high() const noexcept { return high_; }
    [[nodiscard]] constexpr double low() const noexcept { return low_; }
    [[nodiscard]] constexpr double close() const noexcept { return close_; }

    friend constexpr bool operator==(const OHLC& a, const OHLC& b) noexcept {
        return same_bits(a.open_, b.open_) && same_bits(a.high_, b.high_) && same_bits(a.low_, b.low_) &&
               same_bits(a.close_, b.close_);
    }

private:
    double open_;
    double high_;
    double low_;
    double close_;
};

/**
 * @brief A point used as the key of a vector series; ordered by x, then y.
 */
struct XYCoordinate {
    double x{0.0};
    double y{0.0};

    friend constexpr bool operator==(const XYCoordinate& a, const XYCoordinate& b) noexcept {
        return a.x == b.x && a.y == b.y;
    }

    friend constexpr std::partial_ordering operator<=>(const XYCoordinate& a, const XYCoordinate& b) noexcept {
        if (auto c = a.x <=> b.x; c != 0) { return c; }
        return a.y <=> b.y;
    }
};

/**
 * @brief Reads a field from an optional payload, NaN when the payload is absent.
 */
template<typename Record, typename Getter>
[[nodiscard]] constexpr double field_or_missing(const std::optional<Record>& record, Getter getter) {
    return record ? (*record.*getter)() : MISSING_VALUE;
}

} // namespace chartdata
