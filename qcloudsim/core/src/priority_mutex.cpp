#include <qcloudsim/core/priority_mutex.hpp>
#include <qcloudsim/core/engine.hpp>

#include <utility>

namespace qcloudsim::core {

void PriorityMutex::Lock::release() {
    if (mutex_ != nullptr) {
        std::exchange(mutex_, nullptr)->unlock();
    }
}

PriorityMutex::PriorityMutex(Engine& engine)
    : engine_(engine) {}

void PriorityMutex::request(int priority, Continuation on_granted) {
    if (!locked_ && waiters_.empty()) {
        locked_ = true;
        on_granted(Lock{*this});
        return;
    }
    waiters_.emplace(WaitKey{priority, arrivals_++}, std::move(on_granted));
}

void PriorityMutex::drop_waiters() {
    auto dropped = std::exchange(waiters_, {});
}

void PriorityMutex::unlock() {
    if (waiters_.empty()) {
        locked_ = false;
        return;
    }

    // Hand over directly: the mutex stays locked on behalf of the waiter
    auto best = waiters_.begin();
    Continuation resume = std::move(best->second);
    waiters_.erase(best);
    engine_.schedule(Duration::zero(), [this, resume = std::move(resume)]() {
        resume(Lock{*this});
    });
}

} // namespace qcloudsim::core
