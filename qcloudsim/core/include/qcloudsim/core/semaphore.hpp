#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <string>

namespace qcloudsim::core {

class Engine;

/// @brief Counting semaphore modelling a bounded pool of capacity units.
///
/// The level always stays within [0, capacity]. acquire(n) continues
/// synchronously when no earlier request is waiting and the level covers
/// @p n; otherwise the request joins a FIFO queue. release(n) raises the
/// level and then serves waiters strictly in arrival order, stopping at
/// the first one the level cannot cover. A large request at the head of
/// the queue therefore holds back smaller requests behind it.
///
/// A granted waiter has its units deducted at release time and is
/// resumed through a zero-delay engine event.
///
/// Requests that can never succeed (non-positive amounts, amounts above
/// capacity) and releases that would overflow the capacity throw
/// ResourceError instead of blocking.
///
/// @ingroup core_resources
class Semaphore {
public:
    using Continuation = std::function<void()>;

    /// @brief Construct a semaphore starting full.
    /// @throws ResourceError if @p capacity is negative.
    Semaphore(Engine& engine, std::string name, int64_t capacity);

    /// @brief Construct a semaphore with an explicit initial level.
    /// @throws ResourceError if @p initial is outside [0, capacity].
    Semaphore(Engine& engine, std::string name, int64_t capacity, int64_t initial);

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    /// @brief Take @p amount units, resuming @p on_acquired once they are held.
    /// @throws ResourceError if @p amount <= 0 or @p amount > capacity().
    void acquire(int64_t amount, Continuation on_acquired);

    /// @brief Return @p amount units and wake eligible waiters.
    /// @throws ResourceError if @p amount <= 0 or the level would exceed capacity().
    void release(int64_t amount);

    /// @brief Forget every queued request without granting it.
    ///
    /// Used on teardown; the level is left unchanged.
    void drop_waiters();

    [[nodiscard]] int64_t level() const noexcept { return level_; }
    [[nodiscard]] int64_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t waiting() const noexcept { return waiters_.size(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    struct Waiter {
        int64_t amount;
        Continuation resume;
    };

    void wake_waiters();

    Engine& engine_;
    std::string name_;
    int64_t capacity_;
    int64_t level_;
    std::deque<Waiter> waiters_;
};

} // namespace qcloudsim::core
