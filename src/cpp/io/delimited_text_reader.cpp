#include <chartdata/io/delimited_text_reader.h>
#include <chartdata/util/errors.h>
#include <chartdata/util/logging.h>
#include <chartdata/util/string_utils.h>

#include <fstream>
#include <istream>
#include <utility>

namespace chartdata {

    DelimitedTextReader::DelimitedTextReader(ReaderConfig config) : config_(config) {}

    CategoryTable DelimitedTextReader::read(std::istream &in) const {
        CategoryTable table{config_.table};
        std::vector<std::string> column_keys;

        std::string line;
        size_t line_index = 0;
        size_t skipped = 0;
        while (std::getline(in, line)) {
            if (line_index == 0) {
                column_keys = extract_column_keys(line);
            } else if (trim(line).empty()) {
                ++skipped;
            } else {
                extract_row(line, line_index, column_keys, table);
            }
            ++line_index;
        }

        if (in.bad()) {
            log(LogLevel::warning, "Read failed after {} lines", line_index);
            throw_error<io_error>("Read failed after {} lines", line_index);
        }

        log(LogLevel::debug, "Read {} lines: {} columns, {} rows, {} cells ({} blank lines skipped)", line_index,
            column_keys.size(), table.row_count(), table.cell_count(), skipped);
        return table;
    }

    CategoryTable DelimitedTextReader::read_file(const std::filesystem::path &path) const {
        std::ifstream in{path};
        if (!in) {
            log(LogLevel::warning, "Cannot open '{}'", path.string());
            throw_error<io_error>("Cannot open '{}'", path.string());
        }
        return read(in);
    }

    std::vector<std::string> DelimitedTextReader::extract_column_keys(std::string_view line) const {
        auto fields = split_fields(line, config_.field_delimiter);
        std::vector<std::string> keys;
        keys.reserve(fields.size());
        for (size_t i = config_.header_has_row_label ? 1 : 0; i < fields.size(); ++i) {
            keys.emplace_back(remove_text_delimiters(fields[i], config_.text_delimiter));
        }
        return keys;
    }

    void DelimitedTextReader::extract_row(std::string_view line, size_t line_index,
                                          const std::vector<std::string> &column_keys, CategoryTable &table) const {
        auto fields = split_fields(line, config_.field_delimiter);
        std::string row_key{remove_text_delimiters(fields[0], config_.text_delimiter)};

        std::vector<double> values;
        values.reserve(fields.size() - 1);
        for (size_t i = 1; i < fields.size(); ++i) {
            if (i > column_keys.size()) { throw_error<column_count_error>(line_index, i, column_keys.size()); }
            auto text = remove_text_delimiters(fields[i], config_.text_delimiter);
            auto value = parse_double(text);
            if (!value) { throw_error<malformed_number_error>(line_index, i, text); }
            values.push_back(*value);
        }

        for (size_t i = 0; i < values.size(); ++i) { table.set_value(values[i], row_key, column_keys[i]); }
    }

} // namespace chartdata
