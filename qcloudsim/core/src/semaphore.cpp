#include <qcloudsim/core/semaphore.hpp>
#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/error.hpp>

#include <utility>

namespace qcloudsim::core {

Semaphore::Semaphore(Engine& engine, std::string name, int64_t capacity)
    : Semaphore(engine, std::move(name), capacity, capacity) {}

Semaphore::Semaphore(Engine& engine, std::string name, int64_t capacity, int64_t initial)
    : engine_(engine)
    , name_(std::move(name))
    , capacity_(capacity)
    , level_(initial) {
    if (capacity_ < 0) {
        throw ResourceError(name_ + ": capacity must be non-negative");
    }
    if (initial < 0 || initial > capacity_) {
        throw ResourceError(name_ + ": initial level must lie within [0, capacity]");
    }
}

void Semaphore::acquire(int64_t amount, Continuation on_acquired) {
    if (amount <= 0) {
        throw ResourceError(name_ + ": acquire amount must be positive");
    }
    if (amount > capacity_) {
        throw ResourceError(name_ + ": acquire of " + std::to_string(amount) +
                            " units exceeds capacity " + std::to_string(capacity_));
    }

    if (waiters_.empty() && level_ >= amount) {
        level_ -= amount;
        on_acquired();
        return;
    }
    waiters_.push_back(Waiter{amount, std::move(on_acquired)});
}

void Semaphore::release(int64_t amount) {
    if (amount <= 0) {
        throw ResourceError(name_ + ": release amount must be positive");
    }
    if (level_ + amount > capacity_) {
        throw ResourceError(name_ + ": release of " + std::to_string(amount) +
                            " units would exceed capacity " + std::to_string(capacity_));
    }
    level_ += amount;
    wake_waiters();
}

void Semaphore::drop_waiters() {
    auto dropped = std::exchange(waiters_, {});
}

void Semaphore::wake_waiters() {
    while (!waiters_.empty() && waiters_.front().amount <= level_) {
        Waiter waiter = std::move(waiters_.front());
        waiters_.pop_front();
        level_ -= waiter.amount;
        engine_.schedule(Duration::zero(), std::move(waiter.resume));
    }
}

} // namespace qcloudsim::core
