#include <qcloudsim/algo/error.hpp>

namespace qcloudsim::algo {

SchedulerPolicy parse_scheduler_policy(std::string_view name) {
    if (name == "serial") {
        return SchedulerPolicy::Serial;
    }
    if (name == "capacity" || name == "capacity_aware") {
        return SchedulerPolicy::CapacityAware;
    }
    throw ConfigurationError("Unknown scheduler policy: " + std::string(name));
}

BulkPolicy parse_bulk_policy(std::string_view name) {
    if (name == "fast") {
        return BulkPolicy::Fast;
    }
    if (name == "smart") {
        return BulkPolicy::Smart;
    }
    throw ConfigurationError("Unknown bulk policy: " + std::string(name));
}

} // namespace qcloudsim::algo
