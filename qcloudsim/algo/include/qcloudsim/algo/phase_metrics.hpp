#pragma once

#include <qcloudsim/core/types.hpp>

#include <cstddef>
#include <string_view>

namespace qcloudsim::core {
class Engine;
class JobLedger;
} // namespace qcloudsim::core

namespace qcloudsim::algo {

/// @brief Derive wait, service and turnaround of one phase run.
/// @ingroup algo
///
/// Reads the @p index-th `<phase>_arrive`, `<phase>_start` and
/// `<phase>_finish` entries of @p job and records `<phase>_wait_<index>`,
/// `<phase>_svc_<index>` and `<phase>_turn_<index>`, rounded to 4
/// decimals. When a stamp is missing a `warning` trace record is emitted
/// and nothing is recorded.
///
/// @param phase Ledger prefix, "qpu" or "cpu".
/// @return True when the three metrics were recorded.
bool record_phase_metrics(core::Engine& engine, core::JobLedger& ledger, core::JobId job,
                          std::string_view phase, std::size_t index);

/// @brief Record `makespan = last <phase>_finish - arrival` once for @p job.
///
/// Does nothing if a makespan is already present. Missing stamps are
/// reported like in record_phase_metrics().
///
/// @param phase Ledger prefix of the job's final phase ("cpu" for hybrid jobs).
/// @return True when a makespan was recorded by this call.
bool record_makespan(core::Engine& engine, core::JobLedger& ledger, core::JobId job,
                     std::string_view phase = "cpu");

} // namespace qcloudsim::algo
