#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <utility>

namespace qcloudsim::core {

class Engine;

/// @brief Single-holder lock with priority-then-FIFO ordered waiters.
///
/// Waiters are ranked by (priority ascending, arrival order ascending):
/// priority 1 outranks priority 2, and equal priorities are served in the
/// order they asked. When the mutex is free and nobody waits, request()
/// grants synchronously. Otherwise the request is queued and, on release,
/// the best-ranked waiter becomes the holder immediately and is resumed
/// through a zero-delay engine event.
///
/// Ownership is represented by a move-only Lock handle. Destroying the
/// handle (normal scope exit, stack unwinding, or destruction of the
/// process that stored it) releases the mutex.
///
/// @code
/// mutex.request(2, [this](PriorityMutex::Lock lock) {
///     held_ = std::move(lock);
///     ...
/// });
/// @endcode
///
/// @ingroup core_resources
class PriorityMutex {
public:
    /// @brief Scoped ownership of a PriorityMutex.
    class Lock {
    public:
        Lock() noexcept = default;
        /// Terminates if the hand-off to the next waiter cannot be scheduled.
        ~Lock() { release(); }

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

        Lock(Lock&& other) noexcept : mutex_(std::exchange(other.mutex_, nullptr)) {}
        Lock& operator=(Lock&& other) noexcept {
            if (this != &other) {
                release();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }

        /// @brief True while this handle holds the mutex.
        [[nodiscard]] bool owns_lock() const noexcept { return mutex_ != nullptr; }

        /// @brief Release early; no-op on an empty handle.
        /// @throws std::bad_alloc if the hand-off event cannot be queued.
        void release();

    private:
        friend class PriorityMutex;
        explicit Lock(PriorityMutex& mutex) noexcept : mutex_(&mutex) {}

        PriorityMutex* mutex_{nullptr};
    };

    using Continuation = std::function<void(Lock)>;

    explicit PriorityMutex(Engine& engine);

    PriorityMutex(const PriorityMutex&) = delete;
    PriorityMutex& operator=(const PriorityMutex&) = delete;

    /// @brief Ask for the mutex at @p priority (lower number = more urgent).
    /// @param priority Rank of this request.
    /// @param on_granted Receives the Lock once the caller is the holder.
    void request(int priority, Continuation on_granted);

    /// @brief Forget every queued request without granting it.
    ///
    /// Used on teardown. The current holder keeps the mutex.
    void drop_waiters();

    [[nodiscard]] bool locked() const noexcept { return locked_; }
    [[nodiscard]] std::size_t waiting() const noexcept { return waiters_.size(); }

private:
    struct WaitKey {
        int priority;
        uint64_t arrival;

        auto operator<=>(const WaitKey&) const = default;
    };

    void unlock();

    Engine& engine_;
    bool locked_{false};
    uint64_t arrivals_{0};
    std::map<WaitKey, Continuation> waiters_;
};

} // namespace qcloudsim::core
