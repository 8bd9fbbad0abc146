#include <qcloudsim/io/metrics.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <string>
#include <string_view>
#include <variant>

namespace qcloudsim::io {

namespace {

// Appends every numeric value logged under keys starting with `prefix`.
void collect(const core::JobRecord& record, std::string_view prefix, std::vector<double>& out) {
    for (auto it = record.lower_bound(prefix); it != record.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        for (const auto& value : it->second) {
            if (const auto* number = std::get_if<double>(&value)) {
                out.push_back(*number);
            }
        }
    }
}

struct PhaseSamples {
    std::vector<double> wait;
    std::vector<double> service;
    std::vector<double> turnaround;

    void collect_from(const core::JobRecord& record, const std::string& phase) {
        collect(record, phase + "_wait_", wait);
        collect(record, phase + "_svc_", service);
        collect(record, phase + "_turn_", turnaround);
    }

    [[nodiscard]] PhaseStats stats() const {
        return PhaseStats{compute_duration_stats(wait), compute_duration_stats(service),
                          compute_duration_stats(turnaround)};
    }
};

void print_stats(std::ostream& out, const char* label, const DurationStats& stats) {
    out << "  " << std::left << std::setw(16) << label << std::right;
    if (stats.count == 0) {
        out << "n/a\n";
        return;
    }
    out << "mean " << std::setw(10) << stats.mean
        << "  max " << std::setw(10) << stats.max
        << "  p95 " << std::setw(10) << stats.percentile_95
        << "  (n=" << stats.count << ")\n";
}

} // anonymous namespace

DurationStats compute_duration_stats(const std::vector<double>& values) {
    DurationStats stats;

    if (values.empty()) {
        return stats;
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    stats.count = sorted.size();
    stats.min = sorted.front();
    stats.max = sorted.back();

    double sum = 0.0;
    for (double val : sorted) {
        sum += val;
    }
    stats.mean = sum / static_cast<double>(sorted.size());

    std::size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 0) {
        stats.median = (sorted[mid - 1] + sorted[mid]) / 2.0;
    } else {
        stats.median = sorted[mid];
    }

    double variance_sum = 0.0;
    for (double val : sorted) {
        double diff = val - stats.mean;
        variance_sum += diff * diff;
    }
    stats.stddev = std::sqrt(variance_sum / static_cast<double>(sorted.size()));

    // Percentiles using linear interpolation
    auto percentile = [&sorted](double pct) -> double {
        if (sorted.size() == 1) {
            return sorted[0];
        }
        double rank = pct / 100.0 * static_cast<double>(sorted.size() - 1);
        auto lower = static_cast<std::size_t>(std::floor(rank));
        auto upper = static_cast<std::size_t>(std::ceil(rank));
        if (lower == upper) {
            return sorted[lower];
        }
        double frac = rank - static_cast<double>(lower);
        return sorted[lower] * (1.0 - frac) + sorted[upper] * frac;
    };

    stats.percentile_95 = percentile(95.0);
    stats.percentile_99 = percentile(99.0);

    return stats;
}

CloudMetrics compute_metrics(const core::JobLedger& ledger) {
    CloudMetrics metrics;
    std::vector<double> makespans;
    std::vector<double> fidelities;
    PhaseSamples qpu;
    PhaseSamples cpu;

    for (const auto& [job, record] : ledger.records()) {
        if (record.count("arrival") != 0) {
            ++metrics.total_jobs;
        }
        if (record.count("rejected") != 0) {
            ++metrics.rejected_jobs;
        }
        if (record.count("makespan") != 0) {
            ++metrics.completed_jobs;
            collect(record, "makespan", makespans);
        }
        collect(record, "fidelity", fidelities);
        qpu.collect_from(record, "qpu");
        cpu.collect_from(record, "cpu");
    }

    metrics.makespan = compute_duration_stats(makespans);
    metrics.qpu = qpu.stats();
    metrics.cpu = cpu.stats();
    metrics.fidelity_samples = fidelities.size();
    if (!fidelities.empty()) {
        double sum = 0.0;
        for (double f : fidelities) {
            sum += f;
        }
        metrics.mean_fidelity = sum / static_cast<double>(fidelities.size());
    }
    return metrics;
}

void print_metrics(const CloudMetrics& metrics, std::ostream& out) {
    auto flags = out.flags();
    auto precision = out.precision();
    out << std::fixed << std::setprecision(4);

    out << "jobs: " << metrics.total_jobs << " submitted, " << metrics.completed_jobs
        << " completed, " << metrics.rejected_jobs << " rejected\n";
    print_stats(out, "makespan", metrics.makespan);
    print_stats(out, "qpu wait", metrics.qpu.wait);
    print_stats(out, "qpu service", metrics.qpu.service);
    print_stats(out, "qpu turnaround", metrics.qpu.turnaround);
    print_stats(out, "cpu wait", metrics.cpu.wait);
    print_stats(out, "cpu service", metrics.cpu.service);
    print_stats(out, "cpu turnaround", metrics.cpu.turnaround);
    if (metrics.fidelity_samples > 0) {
        out << "  " << std::left << std::setw(16) << "fidelity" << std::right
            << "mean " << std::setw(10) << metrics.mean_fidelity
            << "  (n=" << metrics.fidelity_samples << ")\n";
    }

    out.flags(flags);
    out.precision(precision);
}

} // namespace qcloudsim::io
