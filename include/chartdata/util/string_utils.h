#ifndef CHARTDATA_STRING_UTILS_H
#define CHARTDATA_STRING_UTILS_H

#include <chartdata/chartdata_export.h>
#include <chartdata/util/date_time.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chartdata {
    template<typename T>
    std::string to_string(const T &value);

    template<>
    CHARTDATA_EXPORT std::string to_string(const chart_time_t &value);

    // Strips leading and trailing blanks (space, tab, CR, LF).
    CHARTDATA_EXPORT std::string_view trim(std::string_view text) noexcept;

    /**
     * Trims the text and removes one enclosing pair of text delimiters, e.g. "\"abc\"" -> "abc".
     * An unmatched delimiter at either end is left in place.
     */
    CHARTDATA_EXPORT std::string_view remove_text_delimiters(std::string_view text, char text_delimiter) noexcept;

    /**
     * Splits a line at every occurrence of the delimiter. There is no escaping, so a quoted field
     * containing the delimiter is split too. An empty line yields a single empty field.
     */
    CHARTDATA_EXPORT std::vector<std::string_view> split_fields(std::string_view line, char delimiter);

    // Parses the whole (trimmed) text as a double; nullopt when any character is left unconsumed.
    // Magnitudes beyond the double range round to infinity, ones below it to zero.
    CHARTDATA_EXPORT std::optional<double> parse_double(std::string_view text);
} // namespace chartdata

#endif  // CHARTDATA_STRING_UTILS_H
