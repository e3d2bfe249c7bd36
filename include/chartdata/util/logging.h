#ifndef CHARTDATA_UTIL_LOGGING_H
#define CHARTDATA_UTIL_LOGGING_H

#include <chartdata/chartdata_export.h>

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace chartdata {

    enum class LogLevel : uint8_t { debug, info, warning, error, off };

    /**
     * Current threshold. On first use it is read from the CHARTDATA_LOG_LEVEL environment variable
     * (debug|info|warning|error|off), falling back to warning.
     */
    CHARTDATA_EXPORT LogLevel log_level() noexcept;

    CHARTDATA_EXPORT void set_log_level(LogLevel level) noexcept;

    [[nodiscard]] CHARTDATA_EXPORT std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

    [[nodiscard]] CHARTDATA_EXPORT std::string_view log_level_name(LogLevel level) noexcept;

    [[nodiscard]] inline bool log_enabled(LogLevel level) noexcept {
        return level != LogLevel::off && level >= log_level();
    }

    CHARTDATA_EXPORT void write_log_line(LogLevel level, std::string_view message);

    template<typename... Ts>
    void log(LogLevel level, fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        if (!log_enabled(level)) { return; }
        write_log_line(level, fmt::format(fmt_str, std::forward<Ts>(xs)...));
    }

} // namespace chartdata

#endif // CHARTDATA_UTIL_LOGGING_H
