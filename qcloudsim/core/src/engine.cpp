#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/error.hpp>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

#include <utility>

namespace qcloudsim::core {

void Engine::schedule(Duration delay, Callback callback) {
    if (delay < Duration::zero()) {
        throw InvalidStateError("Cannot schedule an event with a negative delay");
    }
    EventKey key{current_time_ + delay, sequence_++};
    event_queue_.emplace(key, Event{std::move(callback)});
}

void Engine::schedule_at(TimePoint when, Callback callback) {
    if (when < current_time_) {
        throw InvalidStateError("Cannot schedule event in the past");
    }
    EventKey key{when, sequence_++};
    event_queue_.emplace(key, Event{std::move(callback)});
}

void Engine::clear() {
    while (!event_queue_.empty()) {
        // Continuations die outside the live queue so they may schedule while being destroyed
        auto dropped = std::exchange(event_queue_, {});
    }
}

void Engine::run() {
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_) {
        process_timestep();
    }
}

void Engine::run(TimePoint until) {
    if (until < current_time_) {
        throw InvalidStateError("Cannot run until a time in the past");
    }
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_) {
        // Check if next event is beyond our stop time
        if (event_queue_.begin()->first.time > until) {
            break;
        }
        process_timestep();
    }
    if (!stop_requested_ && current_time_ < until) {
        current_time_ = until;
    }
}

void Engine::run(const std::function<bool()>& stop_condition) {
    stop_requested_ = false;
    while (!event_queue_.empty() && !stop_requested_ && !stop_condition()) {
        process_timestep();
    }
}

void Engine::process_timestep() {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    TimePoint timestep = event_queue_.begin()->first.time;
    current_time_ = timestep;

    // Zero-delay events submitted while processing land in this same timestep
    while (!event_queue_.empty()) {
        auto it = event_queue_.begin();
        if (it->first.time != timestep) {
            break;
        }

        Event event = std::move(it->second);
        event_queue_.erase(it);

        if (event.continuation) {
            event.continuation();
        }
    }
}

} // namespace qcloudsim::core
