#include "event_bus.hpp"
#include <algorithm>

namespace sift {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    auto sub = std::make_shared<Subscription>();
    sub->id = id;
    sub->handler = std::move(handler);
    handlers_[tag].push_back(std::move(sub));
    tag_of_[id] = tag;
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tag_it = tag_of_.find(id);
    if (tag_it == tag_of_.end()) return false;

    auto& subs = handlers_[tag_it->second];
    auto it = std::find_if(subs.begin(), subs.end(),
                           [id](const SubscriptionPtr& s) { return s->id == id; });
    if (it != subs.end()) {
        (*it)->active.store(false);
        subs.erase(it);
    }
    if (subs.empty()) handlers_.erase(tag_it->second);
    tag_of_.erase(tag_it);
    return true;
}

void EventBus::publish(const Event& event) {
    // Snapshot under lock, then call without lock held.
    std::vector<SubscriptionPtr> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it == handlers_.end()) return;
        to_call = it->second;
    }
    for (const auto& sub : to_call) {
        if (sub->active.load()) sub->handler(event);
    }
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [tag, subs] : handlers_) {
        for (auto& sub : subs) sub->active.store(false);
    }
    handlers_.clear();
    tag_of_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(tag);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace sift
