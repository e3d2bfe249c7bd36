#include <chartdata/util/string_utils.h>

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <ctime>
#include <string>

namespace chartdata {
    template<>
    std::string to_string(const chart_time_t &value) {
        auto secs = std::chrono::floor<std::chrono::seconds>(value);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(value - secs).count();
        auto tt = chart_clock::to_time_t(secs);
        std::tm tm{};
        gmtime_r(&tt, &tm);
        char buffer[32];
        std::strftime(buffer, 32, "%Y-%m-%d %H:%M:%S", &tm);
        if (micros == 0) { return {buffer}; }
        return fmt::format("{}.{:06}", buffer, micros);
    }

    namespace {
        constexpr bool is_blank(char c) noexcept { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
    } // namespace

    std::string_view trim(std::string_view text) noexcept {
        while (!text.empty() && is_blank(text.front())) { text.remove_prefix(1); }
        while (!text.empty() && is_blank(text.back())) { text.remove_suffix(1); }
        return text;
    }

    std::string_view remove_text_delimiters(std::string_view text, char text_delimiter) noexcept {
        auto k = trim(text);
        if (k.size() >= 2 && k.front() == text_delimiter && k.back() == text_delimiter) {
            k.remove_prefix(1);
            k.remove_suffix(1);
        }
        return k;
    }

    std::vector<std::string_view> split_fields(std::string_view line, char delimiter) {
        std::vector<std::string_view> fields;
        size_t start = 0;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == delimiter) {
                fields.push_back(line.substr(start, i - start));
                start = i + 1;
            }
        }
        fields.push_back(line.substr(start));
        return fields;
    }

    std::optional<double> parse_double(std::string_view text) {
        auto t = trim(text);
        // from_chars rejects an explicit plus sign
        if (t.size() > 1 && t.front() == '+' && t[1] != '-') { t.remove_prefix(1); }
        if (t.empty()) { return std::nullopt; }

        double value{};
        auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
        if (ptr != t.data() + t.size()) { return std::nullopt; }
        if (ec == std::errc::result_out_of_range) {
            // from_chars leaves value untouched on overflow and underflow; strtod rounds to +-inf or +-0
            std::string copy{t};
            return std::strtod(copy.c_str(), nullptr);
        }
        if (ec != std::errc{}) { return std::nullopt; }
        return value;
    }
} // namespace chartdata
