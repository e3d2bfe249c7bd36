//
// fmt support for the payload records and series keys.
//

#ifndef CHARTDATA_FORMAT_H
#define CHARTDATA_FORMAT_H

#include <chartdata/types/paired_values.h>

#include <fmt/format.h>

#include <type_traits>

namespace fmt {
    // Records have no format options; "{}" is the only accepted form.
    template<typename Record>
        requires std::is_same_v<Record, chartdata::Vector> || std::is_same_v<Record, chartdata::XInterval> ||
                 std::is_same_v<Record, chartdata::YInterval> || std::is_same_v<Record, chartdata::OHLC> ||
                 std::is_same_v<Record, chartdata::XYCoordinate>
    struct formatter<Record> {
        constexpr auto parse(format_parse_context &ctx) {
            auto it = ctx.begin();
            if (it != ctx.end() && *it != '}') { throw format_error("Invalid format specifier for chartdata record"); }
            return it;
        }

        template<typename FormatContext>
        auto format(const Record &value, FormatContext &ctx) const {
            using namespace chartdata;
            if constexpr (std::is_same_v<Record, Vector>) {
                return format_to(ctx.out(), "Vector(dx={}, dy={})", value.x(), value.y());
            } else if constexpr (std::is_same_v<Record, XInterval>) {
                return format_to(ctx.out(), "XInterval(x_low={}, x_high={}, y={})", value.x_low(), value.x_high(),
                                 value.y());
            } else if constexpr (std::is_same_v<Record, YInterval>) {
                return format_to(ctx.out(), "YInterval(y={}, y_low={}, y_high={})", value.y(), value.y_low(),
                                 value.y_high());
            } else if constexpr (std::is_same_v<Record, OHLC>) {
                return format_to(ctx.out(), "OHLC(open={}, high={}, low={}, close={})", value.open(), value.high(),
                                 value.low(), value.close());
            } else {
                return format_to(ctx.out(), "({}, {})", value.x, value.y);
            }
        }
    };
} // namespace fmt

#endif  // CHARTDATA_FORMAT_H
