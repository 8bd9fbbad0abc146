#pragma once

/// @file metrics.hpp
/// @brief Post-simulation metrics derived from the job ledger.
///
/// Aggregates the per-job entries recorded during a run (arrival,
/// rejection, phase wait/service/turnaround, makespan, fidelity) into a
/// summary that the command line tool prints with `--metrics`.
///
/// @ingroup io_metrics

#include <qcloudsim/core/job_ledger.hpp>

#include <cstdint>
#include <ostream>
#include <vector>

namespace qcloudsim::io {

/// @brief Summary statistics for a collection of durations.
///
/// @ingroup io_metrics
/// @see compute_duration_stats
struct DurationStats {
    std::size_t count{0};       ///< Number of samples.
    double min{0.0};            ///< Minimum value.
    double max{0.0};            ///< Maximum value.
    double mean{0.0};           ///< Arithmetic mean.
    double median{0.0};         ///< Median (50th percentile).
    double stddev{0.0};         ///< Population standard deviation.
    double percentile_95{0.0};  ///< 95th percentile (linear interpolation).
    double percentile_99{0.0};  ///< 99th percentile (linear interpolation).
};

/// @brief Wait, service and turnaround statistics of one phase kind.
///
/// Every QPU (or CPU) run of every job contributes one sample.
///
/// @ingroup io_metrics
struct PhaseStats {
    DurationStats wait;
    DurationStats service;
    DurationStats turnaround;
};

/// @brief Aggregated metrics of one simulation run.
///
/// @ingroup io_metrics
/// @see compute_metrics
struct CloudMetrics {
    uint64_t total_jobs{0};      ///< Jobs with an `arrival` entry.
    uint64_t completed_jobs{0};  ///< Jobs with a `makespan` entry.
    uint64_t rejected_jobs{0};   ///< Jobs rejected at arrival.

    DurationStats makespan;      ///< Arrival to final completion.
    PhaseStats qpu;
    PhaseStats cpu;

    uint64_t fidelity_samples{0};
    double mean_fidelity{0.0};   ///< Mean over every recorded QPU run.
};

/// @brief Compute summary statistics for a vector of durations.
///
/// Returns a zero-initialized DurationStats when @p values is empty.
/// Percentiles use linear interpolation between closest ranks.
DurationStats compute_duration_stats(const std::vector<double>& values);

/// @brief Aggregate every entry of @p ledger into a CloudMetrics.
CloudMetrics compute_metrics(const core::JobLedger& ledger);

/// @brief Print a human-readable summary of @p metrics.
void print_metrics(const CloudMetrics& metrics, std::ostream& out);

} // namespace qcloudsim::io
