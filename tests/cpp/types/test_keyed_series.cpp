/**
 * @file test_keyed_series.cpp
 * @brief Unit tests for KeyedSeries ordering, duplicate policy and notification.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <chartdata/types/format.h>
#include <chartdata/types/keyed_series.h>

#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace chartdata;

namespace chartdata::test {

struct ChangeCounter : SeriesChangeObserver {
    int changes{0};
    const Series* last{nullptr};

    void on_series_changed(const Series& series) override {
        ++changes;
        last = &series;
    }
};

using IntSeries = KeyedSeries<int, int>;
using DoubleSeries = KeyedSeries<double, int>;

}  // namespace chartdata::test

using chartdata::test::ChangeCounter;
using chartdata::test::DoubleSeries;
using chartdata::test::IntSeries;

namespace {
    constexpr double not_a_number = std::numeric_limits<double>::quiet_NaN();
}

TEST_CASE("Sorted series keeps keys ascending", "[series][sort]") {
    IntSeries s{"s", SeriesConfig{.auto_sort = true, .allow_duplicate_keys = true}};
    s.add(5, 50);
    s.add(1, 10);
    s.add(3, 30);

    REQUIRE(s.size() == 3);
    CHECK(s.key_at(0) == 1);
    CHECK(s.key_at(1) == 3);
    CHECK(s.key_at(2) == 5);
    CHECK(s.value_at(1) == 30);
    CHECK(s.get(2).value == 50);
}

TEST_CASE("Unsorted series keeps insertion order", "[series][sort]") {
    IntSeries s{"s", SeriesConfig{.auto_sort = false, .allow_duplicate_keys = true}};
    s.add(5, 50);
    s.add(1, 10);
    s.add(5, 51);

    CHECK(s.key_at(0) == 5);
    CHECK(s.key_at(1) == 1);
    CHECK(s.key_at(2) == 5);
    CHECK(s.index_of(5) == 0u);
    CHECK(s.index_of(1) == 1u);
    CHECK_FALSE(s.index_of(7).has_value());
}

TEST_CASE("Equal keys keep insertion order and index_of finds the earliest", "[series][sort][duplicates]") {
    IntSeries s{"s"};
    s.add(2, 0);
    s.add(1, 1);
    s.add(2, 2);
    s.add(2, 3);
    s.add(0, 4);

    // 0, 1, 2(0), 2(2), 2(3)
    REQUIRE(s.size() == 5);
    CHECK(s.value_at(2) == 0);
    CHECK(s.value_at(3) == 2);
    CHECK(s.value_at(4) == 3);
    CHECK(s.index_of(2) == 2u);
    CHECK(s.index_of(0) == 0u);
}

TEST_CASE("Random inserts keep sorted, stable order with leftmost lookup", "[series][sort][property]") {
    auto seed = GENERATE(1u, 7u, 42u, 1234u);
    std::mt19937 rng{seed};
    std::uniform_int_distribution<int> key_dist{0, 20};

    IntSeries s{"s"};
    for (int sequence = 0; sequence < 200; ++sequence) {
        int key = key_dist(rng);
        s.add(key, sequence);

        auto index = s.index_of(key);
        REQUIRE(index.has_value());
        CHECK(s.key_at(*index) == key);
        if (*index > 0) { CHECK(s.key_at(*index - 1) < key); }

        for (size_t i = 1; i < s.size(); ++i) {
            REQUIRE(s.key_at(i - 1) <= s.key_at(i));
            // equal keys appear in insertion order, and values are insertion sequence numbers
            if (s.key_at(i - 1) == s.key_at(i)) { REQUIRE(s.value_at(i - 1) < s.value_at(i)); }
        }
    }
}

TEST_CASE("Duplicate keys are rejected when disallowed", "[series][duplicates]") {
    ChangeCounter counter;
    auto sorted = GENERATE(true, false);
    IntSeries s{"s", SeriesConfig{.auto_sort = sorted, .allow_duplicate_keys = false}};
    s.add(1, 10);
    s.add(2, 20);
    s.add_observer(&counter);

    CHECK_THROWS_AS(s.add(1, 11), duplicate_key_error);
    CHECK_THROWS_AS(s.add(2, 21, false), duplicate_key_error);
    CHECK(s.size() == 2);
    CHECK(s.value_at(s.index_of(1).value()) == 10);
    CHECK(counter.changes == 0);

    s.add(3, 30);
    CHECK(s.size() == 3);
    CHECK(counter.changes == 1);
}

TEST_CASE("Positional access outside the series throws", "[series][index]") {
    IntSeries s{"s"};
    CHECK_THROWS_AS(s.get(0), index_out_of_range);

    s.add(1, 10);
    CHECK_THROWS_AS(s.get(1), index_out_of_range);
    CHECK_THROWS_AS(s.key_at(5), index_out_of_range);
    CHECK_THROWS_AS(s.value_at(5), index_out_of_range);
    CHECK_THROWS_AS(s.remove(1), index_out_of_range);
    CHECK_THROWS_AS(s.update_by_index(1, 0), index_out_of_range);
    CHECK(s.size() == 1);

    try {
        (void)s.get(3);
        FAIL("expected index_out_of_range");
    } catch (const index_out_of_range& e) {
        CHECK(e.index() == 3);
        CHECK(e.size() == 1);
    }
}

TEST_CASE("Remove shifts later items down", "[series][remove]") {
    IntSeries s{"s"};
    for (int k = 0; k < 5; ++k) { s.add(k, k * 10); }

    s.remove(1);
    REQUIRE(s.size() == 4);
    CHECK(s.key_at(1) == 2);
    CHECK(s.index_of(4) == 3u);

    s.remove_key(4);
    CHECK(s.size() == 3);
    CHECK_FALSE(s.contains(4));
    CHECK_THROWS_AS(s.remove_key(4), key_not_found_error);
}

TEST_CASE("Update replaces the value of the first matching key", "[series][update]") {
    IntSeries s{"s"};
    s.add(1, 10);
    s.add(1, 11);
    s.add(2, 20);

    s.update(1, 99);
    CHECK(s.value_at(0) == 99);
    CHECK(s.value_at(1) == 11);

    s.update_by_index(2, 42);
    CHECK(s.value_at(2) == 42);

    CHECK_THROWS_AS(s.update(3, 0), key_not_found_error);
}

TEST_CASE("Every successful mutation notifies observers once", "[series][notify]") {
    ChangeCounter counter;
    IntSeries s{"prices"};
    s.add_observer(&counter);

    s.add(1, 10);
    CHECK(counter.changes == 1);
    CHECK(counter.last == &s);
    CHECK(counter.last->name() == "prices");

    s.add(2, 20, false);
    CHECK(counter.changes == 1);

    s.update(2, 21);
    s.remove(0);
    CHECK(counter.changes == 3);

    s.clear();
    CHECK(counter.changes == 4);
    s.clear();
    CHECK(counter.changes == 4);

    s.remove_observer(&counter);
    s.add(3, 30);
    CHECK(counter.changes == 4);
}

TEST_CASE("Notification can be suspended", "[series][notify]") {
    ChangeCounter counter;
    IntSeries s{"s"};
    s.add_observer(&counter);

    SECTION("set_notify fires once when switched back on") {
        s.set_notify(false);
        s.add(1, 10);
        s.add(2, 20);
        CHECK(counter.changes == 0);
        s.set_notify(true);
        CHECK(counter.changes == 1);
        CHECK(s.notify());
    }

    SECTION("add_all fires a single event") {
        std::vector<IntSeries::item_type> items{{3, 30}, {1, 10}, {2, 20}};
        s.add_all(items);
        CHECK(counter.changes == 1);
        CHECK(s.size() == 3);
        CHECK(s.key_at(0) == 1);
        CHECK(s.notify());
    }

    SECTION("add_all restores notification when an item is rejected") {
        IntSeries unique{"u", SeriesConfig{.auto_sort = true, .allow_duplicate_keys = false}};
        unique.add_observer(&counter);
        std::vector<IntSeries::item_type> items{{1, 10}, {2, 20}, {1, 11}, {3, 30}};

        CHECK_THROWS_AS(unique.add_all(items), duplicate_key_error);
        CHECK(unique.size() == 2);
        CHECK(unique.notify());
        CHECK(counter.changes == 1);
    }
}

TEST_CASE("Maximum item count drops the oldest items", "[series][maximum]") {
    IntSeries s{"s", SeriesConfig{.auto_sort = false, .allow_duplicate_keys = true, .maximum_item_count = 3}};
    for (int k = 0; k < 5; ++k) { s.add(k, k); }

    REQUIRE(s.size() == 3);
    CHECK(s.key_at(0) == 2);
    CHECK(s.key_at(2) == 4);

    ChangeCounter counter;
    s.add_observer(&counter);
    s.set_maximum_item_count(1);
    CHECK(s.size() == 1);
    CHECK(s.key_at(0) == 4);
    CHECK(counter.changes == 1);
}

TEST_CASE("NaN keys sort last and are found by index_of", "[series][sort][nan]") {
    DoubleSeries s{"s"};
    s.add(1.0, 1);
    s.add(not_a_number, 2);
    s.add(5.0, 3);
    s.add(3.0, 4);
    s.add(-not_a_number, 5);

    REQUIRE(s.size() == 5);
    CHECK(s.key_at(0) == 1.0);
    CHECK(s.key_at(1) == 3.0);
    CHECK(s.key_at(2) == 5.0);
    CHECK(std::isnan(s.key_at(3)));
    CHECK(std::isnan(s.key_at(4)));
    CHECK(s.value_at(3) == 2);
    CHECK(s.value_at(4) == 5);

    REQUIRE(s.index_of(not_a_number).has_value());
    CHECK(*s.index_of(not_a_number) == 3);
    CHECK(s.index_of(3.0) == 1);

    s.remove_key(not_a_number);
    CHECK(s.size() == 4);
    CHECK(s.value_at(3) == 5);
}

TEST_CASE("Repeated NaN keys are duplicates", "[series][duplicates][nan]") {
    auto sorted = GENERATE(true, false);
    DoubleSeries s{"s", SeriesConfig{.auto_sort = sorted, .allow_duplicate_keys = false}};
    s.add(not_a_number, 1);
    s.add(2.0, 2);

    CHECK_THROWS_AS(s.add(not_a_number, 3), duplicate_key_error);
    CHECK(s.size() == 2);
    CHECK(s.contains(not_a_number));
    CHECK(s.contains(2.0));
}

TEST_CASE("Negative and positive zero are the same key", "[series][duplicates]") {
    DoubleSeries s{"s", SeriesConfig{.auto_sort = true, .allow_duplicate_keys = false}};
    s.add(0.0, 1);
    CHECK_THROWS_AS(s.add(-0.0, 2), duplicate_key_error);
    CHECK(s.index_of(-0.0) == 0);
}

TEST_CASE("Coordinate keys with NaN fields keep a total order", "[series][sort][nan]") {
    KeyedSeries<XYCoordinate, int> s{"s", SeriesConfig{.auto_sort = true, .allow_duplicate_keys = false}};
    s.add(XYCoordinate{1.0, not_a_number}, 1);
    s.add(XYCoordinate{not_a_number, 0.0}, 2);
    s.add(XYCoordinate{1.0, 2.0}, 3);
    s.add(XYCoordinate{0.0, 9.0}, 4);

    REQUIRE(s.size() == 4);
    CHECK(s.value_at(0) == 4);
    CHECK(s.value_at(1) == 3);
    CHECK(s.value_at(2) == 1);
    CHECK(s.value_at(3) == 2);

    CHECK(s.index_of(XYCoordinate{1.0, not_a_number}) == 2);
    CHECK_THROWS_AS(s.add(XYCoordinate{not_a_number, 0.0}, 5), duplicate_key_error);
}

TEST_CASE("Maximum item count can evict the item just added", "[series][maximum]") {
    IntSeries s{"s", SeriesConfig{.auto_sort = true, .maximum_item_count = 2}};
    s.add(5, 50);
    s.add(7, 70);
    s.add(1, 10);

    REQUIRE(s.size() == 2);
    CHECK(s.key_at(0) == 5);
    CHECK(s.key_at(1) == 7);
    CHECK_FALSE(s.contains(1));
}

TEST_CASE("Series exposes configuration and iteration", "[series]") {
    IntSeries s{"s", SeriesConfig{.auto_sort = false, .allow_duplicate_keys = false}};
    CHECK_FALSE(s.auto_sort());
    CHECK_FALSE(s.allow_duplicate_keys());
    CHECK(s.maximum_item_count() == UNLIMITED_ITEM_COUNT);
    CHECK(s.empty());

    s.set_description("test series");
    CHECK(s.description() == "test series");

    s.add(2, 20);
    s.add(1, 10);
    int sum = 0;
    for (const auto& item : s) { sum += item.key * item.value; }
    CHECK(sum == 50);
}
