#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace qcloudsim::algo {

/// @brief Exception thrown when a cloud is configured inconsistently.
/// @ingroup algo
///
/// Raised before the simulation starts: unknown policy names, a bulk
/// policy on a platform with fewer than two quantum devices, or a job
/// feed that would never let the run terminate.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Per-job orchestration strategy.
///
/// @see SerialScheduler, CapacityAwareScheduler
enum class SchedulerPolicy {
    Serial,        ///< Random device, mutex-serialised, single pass.
    CapacityAware  ///< Iterative QPU/CPU pipeline with most-free-first selection (default).
};

/// @brief Placement policy of a job split across several quantum devices.
///
/// @see BulkAllocator
enum class BulkPolicy {
    Fast,  ///< Use every eligible device.
    Smart  ///< Lowest error scores first, as few devices as cover the job.
};

/// @brief Parse "serial" or "capacity".
/// @throws ConfigurationError on any other name.
[[nodiscard]] SchedulerPolicy parse_scheduler_policy(std::string_view name);

/// @brief Parse "fast" or "smart".
/// @throws ConfigurationError on any other name.
[[nodiscard]] BulkPolicy parse_bulk_policy(std::string_view name);

} // namespace qcloudsim::algo
