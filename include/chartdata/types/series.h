#pragma once

/**
 * @file series.h
 * @brief Series - named base for keyed series with change notification.
 *
 * A Series owns nothing but its identity (name, description) and the list of
 * observers interested in it. Every successful mutation of a derived series ends
 * with fire_series_changed(), which calls each observer synchronously. There is
 * no payload: observers re-read the series through its accessors.
 */

#include <chartdata/chartdata_export.h>

#include <string>
#include <utility>
#include <vector>

namespace chartdata {

class Series;

/**
 * @brief Observer interface for series changes.
 *
 * Registered through Series::add_observer(); the caller retains ownership and must
 * unregister before the observer is destroyed.
 */
struct SeriesChangeObserver {
    virtual ~SeriesChangeObserver() = default;

    /**
     * @brief Called after the series has been mutated.
     * @param series The series that changed
     */
    virtual void on_series_changed(const Series& series) = 0;
};

class CHARTDATA_EXPORT Series {
public:
    explicit Series(std::string name, std::string description = {});
    virtual ~Series() = default;

    // Non-copyable (observers are registered against this address), movable
    Series(const Series&) = delete;
    Series& operator=(const Series&) = delete;
    Series(Series&&) noexcept = default;
    Series& operator=(Series&&) noexcept = default;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    void set_description(std::string description) { description_ = std::move(description); }

    // ========== Notification ==========

    [[nodiscard]] bool notify() const { return notify_; }

    /**
     * @brief Enable or disable change notification.
     *
     * Switching notification back on fires one change event, since the series may
     * have been modified while it was off.
     */
    void set_notify(bool notify);

    void add_observer(SeriesChangeObserver* observer);
    void remove_observer(SeriesChangeObserver* observer);
    [[nodiscard]] size_t observer_count() const { return observers_.size(); }

    /**
     * @brief Notify all observers, unless notification is switched off.
     */
    void fire_series_changed();

    /**
     * @brief Switches notification off for its lifetime and restores the previous
     * setting on exit, without firing.
     */
    class SuspendNotifications {
    public:
        explicit SuspendNotifications(Series& series) noexcept : series_(series), previous_(series.notify_) {
            series_.notify_ = false;
        }
        ~SuspendNotifications() { series_.notify_ = previous_; }

        SuspendNotifications(const SuspendNotifications&) = delete;
        SuspendNotifications& operator=(const SuspendNotifications&) = delete;

    private:
        Series& series_;
        bool previous_;
    };

private:
    std::string name_;
    std::string description_;
    bool notify_{true};
    std::vector<SeriesChangeObserver*> observers_;
};

} // namespace chartdata
