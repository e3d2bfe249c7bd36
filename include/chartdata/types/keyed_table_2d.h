#pragma once

/**
 * @file keyed_table_2d.h
 * @brief KeyedTable2D - sparse (row key, column key) -> double table.
 *
 * Rows and columns are identified by independent keys, each kept in first-seen
 * order with a hash index for O(1) lookup. Cells are stored sparsely per row.
 *
 * The table tracks a high and low watermark over every non-missing value ever
 * written. They are updated on write and never recomputed, so overwriting the
 * cell holding the extreme leaves the watermark where it was. Cells are never
 * deleted.
 */

#include <chartdata/types/paired_values.h>

#include <ankerl/unordered_dense.h>

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace chartdata {

inline constexpr double DEFAULT_SPACING = 1.0;

/**
 * @brief Construction parameters for a KeyedTable2D.
 *
 * max_rows, max_cols and spacing describe the grid for presentation (e.g. the
 * chip layout of a wafer); storage does not enforce them.
 */
struct TableConfig {
    size_t max_rows{0};
    size_t max_cols{0};
    double spacing{DEFAULT_SPACING};
};

template<typename RowKey, typename ColumnKey>
class KeyedTable2D {
public:
    using row_key_type = RowKey;
    using column_key_type = ColumnKey;

    // ========== Construction ==========

    explicit KeyedTable2D(TableConfig config = {}) : config_(config) {}

    [[nodiscard]] size_t max_rows() const { return config_.max_rows; }
    [[nodiscard]] size_t max_cols() const { return config_.max_cols; }
    [[nodiscard]] double spacing() const { return config_.spacing; }
    void set_spacing(double spacing) { config_.spacing = spacing; }

    // ========== Cells ==========

    /**
     * @brief Insert or overwrite the cell at (row, column).
     *
     * MISSING_VALUE (NaN) is stored like any other value but does not move the
     * watermarks.
     */
    void set_value(double value, const RowKey& row, const ColumnKey& column) {
        size_t r = ensure_row(row);
        size_t c = ensure_column(column);
        rows_[r].insert_or_assign(c, value);

        if (std::isnan(value)) { return; }
        if (value > max_) { max_ = value; }
        if (value < min_) { min_ = value; }
    }

    /**
     * @brief The stored value, or MISSING_VALUE when there is no cell.
     */
    [[nodiscard]] double get_value(const RowKey& row, const ColumnKey& column) const {
        auto r = row_index(row);
        auto c = column_index(column);
        if (!r || !c) { return MISSING_VALUE; }
        return value_at(*r, *c);
    }

    /**
     * @brief Positional read; MISSING_VALUE for an empty cell or an index out of range.
     */
    [[nodiscard]] double value_at(size_t row_index, size_t column_index) const {
        if (row_index >= rows_.size()) { return MISSING_VALUE; }
        const auto& cells = rows_[row_index];
        auto it = cells.find(column_index);
        return it == cells.end() ? MISSING_VALUE : it->second;
    }

    [[nodiscard]] bool has_value(const RowKey& row, const ColumnKey& column) const {
        auto r = row_index(row);
        auto c = column_index(column);
        return r && c && rows_[*r].contains(*c);
    }

    // ========== Watermarks ==========

    /**
     * @brief Highest non-missing value written so far; -infinity before the first write.
     */
    [[nodiscard]] double max() const { return max_; }

    /**
     * @brief Lowest non-missing value written so far; +infinity before the first write.
     */
    [[nodiscard]] double min() const { return min_; }

    /**
     * @brief Number of distinct non-missing values currently stored (0.0 and -0.0 count once).
     */
    [[nodiscard]] size_t unique_value_count() const {
        ankerl::unordered_dense::set<double> values;
        for (const auto& cells : rows_) {
            for (const auto& [_, value] : cells) {
                if (std::isnan(value)) { continue; }
                values.insert(value == 0.0 ? 0.0 : value);
            }
        }
        return values.size();
    }

    // ========== Keys ==========

    [[nodiscard]] size_t row_count() const { return row_keys_.size(); }
    [[nodiscard]] size_t column_count() const { return column_keys_.size(); }

    [[nodiscard]] size_t cell_count() const {
        size_t count = 0;
        for (const auto& cells : rows_) { count += cells.size(); }
        return count;
    }

    [[nodiscard]] bool empty() const { return cell_count() == 0; }

    [[nodiscard]] const std::vector<RowKey>& row_keys() const { return row_keys_; }
    [[nodiscard]] const std::vector<ColumnKey>& column_keys() const { return column_keys_; }

    [[nodiscard]] std::optional<size_t> row_index(const RowKey& key) const {
        auto it = row_index_.find(key);
        if (it == row_index_.end()) { return std::nullopt; }
        return it->second;
    }

    [[nodiscard]] std::optional<size_t> column_index(const ColumnKey& key) const {
        auto it = column_index_.find(key);
        if (it == column_index_.end()) { return std::nullopt; }
        return it->second;
    }

private:
    size_t ensure_row(const RowKey& key) {
        auto [it, inserted] = row_index_.try_emplace(key, row_keys_.size());
        if (inserted) {
            row_keys_.push_back(key);
            rows_.emplace_back();
        }
        return it->second;
    }

    size_t ensure_column(const ColumnKey& key) {
        auto [it, inserted] = column_index_.try_emplace(key, column_keys_.size());
        if (inserted) { column_keys_.push_back(key); }
        return it->second;
    }

    TableConfig config_;

    std::vector<RowKey> row_keys_;
    std::vector<ColumnKey> column_keys_;
    ankerl::unordered_dense::map<RowKey, size_t> row_index_;
    ankerl::unordered_dense::map<ColumnKey, size_t> column_index_;

    // rows_[r] maps column index -> value for the r-th row key
    std::vector<ankerl::unordered_dense::map<size_t, double>> rows_;

    double max_{-std::numeric_limits<double>::infinity()};
    double min_{std::numeric_limits<double>::infinity()};
};

/**
 * @brief Wafer map data: row key is chip x, column key is chip y.
 */
using WaferMapDataset = KeyedTable2D<int, int>;

/**
 * @brief Category data as produced by DelimitedTextReader.
 */
using CategoryTable = KeyedTable2D<std::string, std::string>;

} // namespace chartdata
