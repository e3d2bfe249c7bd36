#ifndef CHARTDATA_UTIL_ERRORS
#define CHARTDATA_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chartdata {

    struct duplicate_key_error : std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    struct key_not_found_error : std::out_of_range {
        using std::out_of_range::out_of_range;
    };

    struct index_out_of_range : std::out_of_range {
        index_out_of_range(size_t index, size_t size)
            : std::out_of_range{fmt::format("Index {} is out of range for size {}", index, size)}
            , index_{index}
            , size_{size}
        {}

        [[nodiscard]] size_t index() const noexcept { return index_; }
        [[nodiscard]] size_t size() const noexcept { return size_; }

    private:
        size_t index_;
        size_t size_;
    };

    struct io_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Base for errors raised while ingesting delimited text; line and field are zero based.
    struct ingest_error : std::runtime_error {
        ingest_error(std::string_view what, size_t line, size_t field)
            : std::runtime_error{fmt::format("{} (line {}, field {})", what, line, field)}
            , line_{line}
            , field_{field}
        {}

        [[nodiscard]] size_t line() const noexcept { return line_; }
        [[nodiscard]] size_t field() const noexcept { return field_; }

    private:
        size_t line_;
        size_t field_;
    };

    struct malformed_number_error : ingest_error {
        malformed_number_error(size_t line, size_t field, std::string_view text)
            : ingest_error{fmt::format("Cannot parse '{}' as a number", text), line, field}
        {}
    };

    struct column_count_error : ingest_error {
        column_count_error(size_t line, size_t field, size_t column_count)
            : ingest_error{fmt::format("Value field has no column key ({} columns in header)", column_count), line, field}
        {}
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Formats the message from args for errors constructed from a string
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace chartdata

#endif // CHARTDATA_UTIL_ERRORS
