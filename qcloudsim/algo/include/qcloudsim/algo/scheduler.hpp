#pragma once

#include <qcloudsim/core/device.hpp>
#include <qcloudsim/core/job.hpp>

#include <functional>
#include <string_view>

namespace qcloudsim::algo {

/// @brief Abstract interface for per-job orchestration strategies.
/// @ingroup algo_schedulers
///
/// One Scheduler instance serves every job of a cloud. run() starts the
/// job's broker process and returns as soon as the job first suspends;
/// @p on_done fires once the job has reached its terminal state. The
/// job must outlive that call.
///
/// @see SerialScheduler, CapacityAwareScheduler
class Scheduler {
public:
    using Completion = std::function<void()>;

    /// @brief Pick the device for the job's current phase.
    ///
    /// @return The chosen device, or nullptr when no device qualifies right now.
    [[nodiscard]] virtual core::Device* select_device(const core::Job& job) = 0;

    /// @brief Drive @p job to completion.
    virtual void run(core::Job& job, Completion on_done) = 0;

    /// @brief Short strategy name for traces and reports.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual ~Scheduler() = default;
};

} // namespace qcloudsim::algo
