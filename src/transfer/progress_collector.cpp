/**
 * @file progress_collector.cpp
 * @brief Implementation of progress_collector
 */

#include "kcenon/object_storage/transfer/progress_collector.h"

#include <iterator>
#include <new>

namespace kcenon::object_storage {

progress_collector::progress_collector(std::size_t capacity)
    : capacity_(capacity == 0 ? default_capacity : capacity) {
}

void progress_collector::enqueue(progress_event event) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.size() >= capacity_) {
        dropped_.fetch_add(1);
        return;
    }
    try {
        events_.push_back(std::move(event));
    } catch (const std::bad_alloc&) {
        dropped_.fetch_add(1);
    }
}

auto progress_collector::drain() -> std::vector<progress_event> {
    std::deque<progress_event> taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        taken.swap(events_);
    }
    return std::vector<progress_event>(std::make_move_iterator(taken.begin()),
                                       std::make_move_iterator(taken.end()));
}

auto progress_collector::drain(const event_handler& handler) -> std::size_t {
    auto events = drain();
    if (handler) {
        for (const auto& event : events) {
            handler(event);
        }
    }
    return events.size();
}

auto progress_collector::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

}  // namespace kcenon::object_storage
