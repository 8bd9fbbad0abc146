#pragma once

#include <qcloudsim/core/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace qcloudsim::core {

/// @brief Position of a job in the broker's phase state machine.
/// @ingroup core_jobs
enum class JobPhase {
    Arrived,
    SelectQpu,
    QpuRun,
    SelectCpu,
    CpuRun,
    Done,
};

/// @brief Short lowercase name of a phase, as used in trace records.
[[nodiscard]] std::string_view to_string(JobPhase phase) noexcept;

/// @brief A hybrid job: descriptor fields plus broker-owned progress.
///
/// The descriptor part comes from the job feed. `phase` and `iteration`
/// are advanced by the broker; a job is terminal once `iteration` reaches
/// `iterations` and the final CPU phase has completed.
///
/// @ingroup core_jobs
struct Job {
    JobId id{0};
    uint32_t num_qubits{1};
    uint32_t depth{1};
    uint64_t num_shots{1};
    int priority{1};
    TimePoint arrival_time{};
    uint32_t iterations{1};

    /// CPU units the broker looks for when choosing a compute device.
    std::optional<int64_t> cpu_units;
    /// Memory bandwidth demand; compute devices default to 20 when unset.
    std::optional<int64_t> mem_bw;

    JobPhase phase{JobPhase::Arrived};
    uint32_t iteration{0};
};

/// Default CPU-unit demand used for compute device selection.
inline constexpr int64_t kDefaultCpuDemand = 8;
/// Default memory-bandwidth demand.
inline constexpr int64_t kDefaultMemBwDemand = 20;

} // namespace qcloudsim::core
