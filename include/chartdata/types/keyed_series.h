#pragma once

/**
 * @file keyed_series.h
 * @brief KeyedSeries - ordered sequence of (key, value) items.
 *
 * KeyedSeries is the storage every concrete series is built on. Items are held
 * in a contiguous vector; position i identifies the same item until a removal
 * shifts later items down.
 *
 * Ordering policy:
 * - auto_sort: items are kept in ascending key order. New items are placed after
 *   all items with an equal key (upper_bound), so equal keys keep insertion order.
 *   Floating-point keys (and the fields of an XYCoordinate) order NaN after every
 *   number, and NaN equals NaN, so NaN keys are found and counted as duplicates.
 * - otherwise: items are appended in insertion order.
 *
 * Duplicate policy:
 * - allow_duplicate_keys = false: adding a key equal to an existing one throws
 *   duplicate_key_error and leaves the series untouched.
 *
 * Lookups are O(log n) when sorted and O(n) otherwise; insertion and removal
 * are O(n) due to element shifting.
 */

#include <chartdata/types/paired_values.h>
#include <chartdata/types/series.h>
#include <chartdata/util/date_time.h>
#include <chartdata/util/errors.h>
#include <chartdata/util/string_utils.h>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <compare>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace chartdata {

inline constexpr size_t UNLIMITED_ITEM_COUNT = std::numeric_limits<size_t>::max();

struct SeriesConfig {
    bool auto_sort{true};
    bool allow_duplicate_keys{true};
    size_t maximum_item_count{UNLIMITED_ITEM_COUNT};
};

/**
 * @brief One entry of a KeyedSeries.
 */
template<typename Key, typename Value>
struct SeriesItem {
    Key key;
    Value value;
};

namespace detail {
    template<typename Key>
    std::string describe_key(const Key& key) {
        if constexpr (std::is_same_v<Key, chart_time_t>) {
            return to_string(key);
        } else if constexpr (fmt::is_formattable<Key>::value) {
            return fmt::format("{}", key);
        } else {
            return "<key>";
        }
    }

    template<typename Key>
    std::weak_ordering compare_keys(const Key& a, const Key& b) {
        if (a < b) { return std::weak_ordering::less; }
        if (b < a) { return std::weak_ordering::greater; }
        return std::weak_ordering::equivalent;
    }

    // NaN sorts last and is equivalent to itself; -0.0 and 0.0 are equivalent.
    inline std::weak_ordering compare_keys(double a, double b) noexcept {
        bool a_nan = std::isnan(a);
        bool b_nan = std::isnan(b);
        if (a_nan || b_nan) { return a_nan <=> b_nan; }
        if (a < b) { return std::weak_ordering::less; }
        if (b < a) { return std::weak_ordering::greater; }
        return std::weak_ordering::equivalent;
    }

    inline std::weak_ordering compare_keys(const XYCoordinate& a, const XYCoordinate& b) noexcept {
        if (auto c = compare_keys(a.x, b.x); c != 0) { return c; }
        return compare_keys(a.y, b.y);
    }
} // namespace detail

template<typename Key, typename Value>
    requires std::totally_ordered<Key>
class KeyedSeries : public Series {
public:
    using key_type = Key;
    using value_type = Value;
    using item_type = SeriesItem<Key, Value>;
    using const_iterator = typename std::vector<item_type>::const_iterator;

    // ========== Construction ==========

    explicit KeyedSeries(std::string name, SeriesConfig config = {})
        : Series(std::move(name))
        , config_(config) {
    }

    [[nodiscard]] bool auto_sort() const { return config_.auto_sort; }
    [[nodiscard]] bool allow_duplicate_keys() const { return config_.allow_duplicate_keys; }
    [[nodiscard]] size_t maximum_item_count() const { return config_.maximum_item_count; }

    /**
     * @brief Set the maximum number of items retained.
     *
     * If the series currently holds more items, the oldest (lowest index) are
     * dropped and a change event is fired.
     */
    void set_maximum_item_count(size_t maximum) {
        config_.maximum_item_count = maximum;
        if (items_.size() > maximum) {
            items_.erase(items_.begin(), items_.begin() + static_cast<std::ptrdiff_t>(items_.size() - maximum));
            fire_series_changed();
        }
    }

    // ========== Size and Access ==========

    [[nodiscard]] size_t size() const { return items_.size(); }
    [[nodiscard]] bool empty() const { return items_.empty(); }

    [[nodiscard]] const_iterator begin() const { return items_.begin(); }
    [[nodiscard]] const_iterator end() const { return items_.end(); }

    /**
     * @throws index_out_of_range if index >= size()
     */
    [[nodiscard]] const item_type& get(size_t index) const {
        check_index(index);
        return items_[index];
    }

    [[nodiscard]] const Key& key_at(size_t index) const { return get(index).key; }
    [[nodiscard]] const Value& value_at(size_t index) const { return get(index).value; }

    /**
     * @brief Index of the first item whose key equals the given key.
     *
     * With auto_sort a leftmost binary search is used, so among equal keys the
     * earliest inserted one is returned.
     */
    [[nodiscard]] std::optional<size_t> index_of(const Key& key) const {
        if (config_.auto_sort) {
            auto it = lower_bound(key);
            if (it != items_.end() && detail::compare_keys(it->key, key) == 0) {
                return static_cast<size_t>(it - items_.begin());
            }
            return std::nullopt;
        }
        auto it = std::find_if(items_.begin(), items_.end(),
                               [&key](const item_type& item) { return detail::compare_keys(item.key, key) == 0; });
        if (it == items_.end()) { return std::nullopt; }
        return static_cast<size_t>(it - items_.begin());
    }

    [[nodiscard]] bool contains(const Key& key) const { return index_of(key).has_value(); }

    // ========== Mutation ==========

    /**
     * @brief Add an item, optionally notifying observers.
     *
     * When the maximum item count is exceeded the item at index 0 is dropped; with
     * auto_sort that is the lowest key, which may be the item just added.
     *
     * @throws duplicate_key_error if duplicates are disallowed and the key exists
     */
    void add(Key key, Value value, bool notify = true) {
        if (!config_.allow_duplicate_keys && contains(key)) {
            throw_error<duplicate_key_error>("Series '{}' already contains key {}", name(), detail::describe_key(key));
        }

        if (config_.auto_sort) {
            auto it = upper_bound(key);
            items_.insert(it, item_type{std::move(key), std::move(value)});
        } else {
            items_.push_back(item_type{std::move(key), std::move(value)});
        }

        if (items_.size() > config_.maximum_item_count) { items_.erase(items_.begin()); }
        if (notify) { fire_series_changed(); }
    }

    /**
     * @brief Add a batch of items with a single change event at the end.
     *
     * Items are added in order; if one is rejected, the ones before it stay and
     * observers are still told about them before the error propagates.
     */
    template<std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, const item_type&>
    void add_all(R&& items) {
        size_t added = 0;
        try {
            SuspendNotifications suspend{*this};
            for (const item_type& item : items) {
                add(item.key, item.value, false);
                ++added;
            }
        } catch (...) {
            if (added > 0) { fire_series_changed(); }
            throw;
        }
        if (added > 0) { fire_series_changed(); }
    }

    /**
     * @brief Replace the value of the first item with the given key.
     * @throws key_not_found_error if no item has the key
     */
    void update(const Key& key, Value value) {
        auto index = index_of(key);
        if (!index) {
            throw_error<key_not_found_error>("Series '{}' has no item for key {}", name(), detail::describe_key(key));
        }
        update_by_index(*index, std::move(value));
    }

    /**
     * @throws index_out_of_range if index >= size()
     */
    void update_by_index(size_t index, Value value) {
        check_index(index);
        items_[index].value = std::move(value);
        fire_series_changed();
    }

    /**
     * @brief Remove the item at index; later items shift down by one.
     * @throws index_out_of_range if index >= size()
     */
    void remove(size_t index) {
        check_index(index);
        items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
        fire_series_changed();
    }

    /**
     * @brief Remove the first item with the given key.
     * @throws key_not_found_error if no item has the key
     */
    void remove_key(const Key& key) {
        auto index = index_of(key);
        if (!index) {
            throw_error<key_not_found_error>("Series '{}' has no item for key {}", name(), detail::describe_key(key));
        }
        remove(*index);
    }

    void clear() {
        if (items_.empty()) { return; }
        items_.clear();
        fire_series_changed();
    }

protected:
    void check_index(size_t index) const {
        if (index >= items_.size()) { throw_error<index_out_of_range>(index, items_.size()); }
    }

private:
    [[nodiscard]] const_iterator lower_bound(const Key& key) const {
        return std::lower_bound(items_.begin(), items_.end(), key,
                                [](const item_type& item, const Key& k) { return detail::compare_keys(item.key, k) < 0; });
    }

    [[nodiscard]] const_iterator upper_bound(const Key& key) const {
        return std::upper_bound(items_.begin(), items_.end(), key,
                                [](const Key& k, const item_type& item) { return detail::compare_keys(k, item.key) < 0; });
    }

    SeriesConfig config_;
    std::vector<item_type> items_;
};

} // namespace chartdata
