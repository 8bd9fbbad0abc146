#pragma once

#include <qcloudsim/core/event.hpp>
#include <qcloudsim/core/trace_writer.hpp>
#include <qcloudsim/core/types.hpp>

#include <cstddef>
#include <functional>
#include <map>

namespace qcloudsim::core {

/// @brief Virtual clock and event kernel.
///
/// The Engine is the only driver of progress in a simulation. It owns a
/// time-ordered queue of pending continuations and advances simulated
/// time by dispatching them in (time, submission order). A process
/// "suspends" by handing a continuation to the engine (directly through
/// schedule(), or indirectly through a PriorityMutex or Semaphore) and
/// returning; it is resumed when the kernel pops that continuation.
///
/// The Engine is non-copyable and non-movable, designed for stack
/// allocation:
///
/// @code
/// core::Engine engine;
/// engine.timeout(core::duration_from_units(1.0), [&] { ... });
/// engine.run();
/// @endcode
///
/// @see PriorityMutex, Semaphore, TraceWriter
/// @ingroup core_engine
class Engine {
public:
    using Callback = std::function<void()>;

    Engine() = default;
    ~Engine() = default;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    /// @brief Returns the current simulation time.
    [[nodiscard]] TimePoint time() const noexcept { return current_time_; }

    /// @brief Enqueue @p callback to run at `time() + delay`.
    /// @param delay Non-negative delay; zero resumes later in the current instant.
    /// @param callback Continuation to invoke.
    /// @throws InvalidStateError if @p delay is negative.
    void schedule(Duration delay, Callback callback);

    /// @brief Suspend the calling process for @p delay.
    ///
    /// Same as schedule(); the name mirrors the suspension point it models.
    void timeout(Duration delay, Callback callback) { schedule(delay, std::move(callback)); }

    /// @brief Enqueue @p callback at an absolute time.
    /// @throws InvalidStateError if @p when is earlier than time().
    void schedule_at(TimePoint when, Callback callback);

    /// @brief Run simulation until the event queue is empty or a stop is requested.
    void run();

    /// @brief Run simulation until the given time point.
    ///
    /// Events due at @p until are processed; the clock is left at @p until.
    /// @throws InvalidStateError if @p until is earlier than time().
    void run(TimePoint until);

    /// @brief Run simulation until the stop condition returns true.
    /// @param stop_condition Evaluated between timesteps.
    void run(const std::function<bool()>& stop_condition);

    /// @brief Request the engine to stop after the current timestep completes.
    ///
    /// Auto-resets at the start of each run() call.
    void request_stop() noexcept { stop_requested_ = true; }

    /// @brief Returns true if a stop has been requested.
    [[nodiscard]] bool stop_requested() const noexcept { return stop_requested_; }

    /// @brief Discard every pending event without running it.
    ///
    /// Destroying a continuation may release what it captured and enqueue
    /// new events (a lock hand-off, for instance); those are discarded too.
    /// The clock is left where it is.
    void clear();

    /// @brief Number of events still waiting in the queue.
    [[nodiscard]] std::size_t pending_events() const noexcept { return event_queue_.size(); }

    /// @brief Set the trace writer for simulation event logging.
    ///
    /// The Engine does not own the writer. Pass nullptr to disable tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Invoke a tracing callback only if a trace writer is set.
    ///
    /// No record is built when tracing is disabled.
    ///
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void trace(F&& func);

private:
    void process_timestep();

    TimePoint current_time_{};
    uint64_t sequence_{0};
    bool stop_requested_{false};

    std::map<EventKey, Event> event_queue_;
    TraceWriter* trace_writer_{nullptr};
};

template<typename F>
void Engine::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_time_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace qcloudsim::core
