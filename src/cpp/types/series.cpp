#include <chartdata/types/series.h>

#include <algorithm>

namespace chartdata {

    Series::Series(std::string name, std::string description)
        : name_(std::move(name)), description_(std::move(description)) {}

    void Series::set_notify(bool notify) {
        if (notify_ == notify) { return; }
        notify_ = notify;
        fire_series_changed();
    }

    void Series::add_observer(SeriesChangeObserver *observer) {
        if (observer) { observers_.push_back(observer); }
    }

    void Series::remove_observer(SeriesChangeObserver *observer) {
        observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
    }

    void Series::fire_series_changed() {
        if (!notify_) { return; }
        // Observers may unregister themselves from inside the callback
        const auto observers = observers_;
        for (auto *obs : observers) { obs->on_series_changed(*this); }
    }

} // namespace chartdata
