#include <chartdata/util/logging.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>

namespace chartdata {

    namespace {
        LogLevel initial_level() noexcept {
            if (const char *env = std::getenv("CHARTDATA_LOG_LEVEL"); env != nullptr) {
                if (auto level = parse_log_level(env)) { return *level; }
            }
            return LogLevel::warning;
        }

        std::atomic<LogLevel> &level_slot() noexcept {
            static std::atomic<LogLevel> level{initial_level()};
            return level;
        }
    } // namespace

    LogLevel log_level() noexcept { return level_slot().load(std::memory_order_relaxed); }

    void set_log_level(LogLevel level) noexcept { level_slot().store(level, std::memory_order_relaxed); }

    std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
        if (name == "debug") { return LogLevel::debug; }
        if (name == "info") { return LogLevel::info; }
        if (name == "warning" || name == "warn") { return LogLevel::warning; }
        if (name == "error") { return LogLevel::error; }
        if (name == "off") { return LogLevel::off; }
        return std::nullopt;
    }

    std::string_view log_level_name(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::debug: return "DEBUG";
            case LogLevel::info: return "INFO";
            case LogLevel::warning: return "WARNING";
            case LogLevel::error: return "ERROR";
            case LogLevel::off: return "OFF";
        }
        return "?";
    }

    void write_log_line(LogLevel level, std::string_view message) {
        fmt::print(stderr, "[chartdata] {} {}\n", log_level_name(level), message);
    }

} // namespace chartdata
