#pragma once

/**
 * @file delimited_text_reader.h
 * @brief DelimitedTextReader - builds a CategoryTable from delimited text.
 *
 * Input layout:
 *
 *     A,B,C          <- header: column keys
 *     r1,1.0,2.0,3.0 <- row key followed by one number per column
 *     r2,4.0,5.0
 *
 * Every delimiter character ends a field; there is no escaping, so a quoted
 * field may not contain the delimiter. Fields are trimmed and one enclosing pair
 * of text delimiters is removed. A row shorter than the header leaves its
 * trailing cells unset.
 */

#include <chartdata/chartdata_export.h>
#include <chartdata/types/keyed_table_2d.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace chartdata {

struct ReaderConfig {
    char field_delimiter{','};
    char text_delimiter{'"'};
    // When set, the first header field labels the row-key column and is not a column key.
    bool header_has_row_label{false};
    TableConfig table{};
};

class CHARTDATA_EXPORT DelimitedTextReader {
public:
    explicit DelimitedTextReader(ReaderConfig config = {});

    [[nodiscard]] const ReaderConfig& config() const { return config_; }

    /**
     * @brief Read the whole stream into a new table.
     *
     * The table is only returned once every line has been parsed, so a failure
     * never exposes a partially filled table.
     *
     * @throws malformed_number_error if a value field is not a number
     * @throws column_count_error if a row has more values than the header has columns
     * @throws io_error if the stream reports a read failure
     */
    [[nodiscard]] CategoryTable read(std::istream& in) const;

    /**
     * @brief Open the file and read it; the file is closed on every exit path.
     * @throws io_error if the file cannot be opened or read
     */
    [[nodiscard]] CategoryTable read_file(const std::filesystem::path& path) const;

    /**
     * @brief Column keys from a header line, in order.
     */
    [[nodiscard]] std::vector<std::string> extract_column_keys(std::string_view line) const;

    /**
     * @brief Parse one data line and write its cells into the table.
     *
     * All fields are parsed before the first write, so a malformed line leaves
     * the table untouched.
     *
     * @param line_index Zero based line number, used in error reports
     */
    void extract_row(std::string_view line, size_t line_index, const std::vector<std::string>& column_keys,
                     CategoryTable& table) const;

private:
    ReaderConfig config_;
};

} // namespace chartdata
