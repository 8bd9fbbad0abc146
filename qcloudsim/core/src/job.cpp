#include <qcloudsim/core/job.hpp>

namespace qcloudsim::core {

std::string_view to_string(JobPhase phase) noexcept {
    switch (phase) {
        case JobPhase::Arrived:   return "arrived";
        case JobPhase::SelectQpu: return "select_qpu";
        case JobPhase::QpuRun:    return "qpu_run";
        case JobPhase::SelectCpu: return "select_cpu";
        case JobPhase::CpuRun:    return "cpu_run";
        case JobPhase::Done:      return "done";
    }
    return "unknown";
}

} // namespace qcloudsim::core
