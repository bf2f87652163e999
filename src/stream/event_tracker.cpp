#include "mcpx/stream/event_tracker.hpp"

#include <algorithm>
#include <iterator>

namespace mcpx {

EventTracker::EventTracker(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool EventTracker::record(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key(id);
    if (members_.contains(key)) {
        return false;
    }
    last_id_ = key;
    insert_locked(std::move(key));
    return true;
}

bool EventTracker::claim(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key(id);
    if (members_.contains(key)) {
        return false;
    }
    insert_locked(std::move(key));
    return true;
}

void EventTracker::release(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key(id);
    if (members_.erase(key) == 0) {
        return;
    }
    const auto it = std::find(order_.rbegin(), order_.rend(), key);
    if (it != order_.rend()) {
        order_.erase(std::next(it).base());
    }
}

void EventTracker::mark_delivered(std::string_view id) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_id_ = std::string(id);
}

bool EventTracker::contains(std::string_view id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.contains(std::string(id));
}

std::optional<std::string> EventTracker::last_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_id_;
}

void EventTracker::seed(std::string id) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_id_ = id;
    if (members_.contains(id) == false) {
        insert_locked(std::move(id));
    }
}

void EventTracker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    members_.clear();
    last_id_ = std::nullopt;
}

std::size_t EventTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_.size();
}

void EventTracker::insert_locked(std::string id) {
    if (order_.size() == capacity_) {
        members_.erase(order_.front());
        order_.pop_front();
    }
    members_.insert(id);
    order_.push_back(std::move(id));
}

// ─────────────────────────────────────────────────────────────────────────────
// EventTrackerRegistry
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<EventTracker> EventTrackerRegistry::acquire(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = trackers_[session_id];
    if (slot == nullptr) {
        slot = std::make_shared<EventTracker>(capacity_);
    }
    return slot;
}

std::shared_ptr<EventTracker> EventTrackerRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = trackers_.find(session_id);
    if (it == trackers_.end()) {
        return nullptr;
    }
    return it->second;
}

void EventTrackerRegistry::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    trackers_.erase(session_id);
}

std::size_t EventTrackerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trackers_.size();
}

}  // namespace mcpx
