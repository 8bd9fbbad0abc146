#include <qcloudsim/core/event_bus.hpp>

#include <utility>

namespace qcloudsim::core {

void EventBus::subscribe(std::string_view event_type, Callback callback) {
    auto it = subscribers_.find(event_type);
    if (it == subscribers_.end()) {
        it = subscribers_.emplace(std::string(event_type), std::vector<Callback>{}).first;
    }
    it->second.push_back(std::move(callback));
}

void EventBus::publish(std::string_view event_type, const DeviceEvent& payload) const {
    auto it = subscribers_.find(event_type);
    if (it == subscribers_.end()) {
        return;
    }
    for (const auto& callback : it->second) {
        callback(payload);
    }
}

std::size_t EventBus::subscriber_count(std::string_view event_type) const {
    auto it = subscribers_.find(event_type);
    return it == subscribers_.end() ? 0 : it->second.size();
}

} // namespace qcloudsim::core
