#include <qcloudsim/io/metrics.hpp>

#include <qcloudsim/core/job_ledger.hpp>

#include <gtest/gtest.h>

#include <iomanip>
#include <sstream>
#include <string>

using namespace qcloudsim::io;
using namespace qcloudsim::core;

// =============================================================================
// Duration statistics
// =============================================================================

TEST(DurationStatsTest, EmptyInput) {
    auto stats = compute_duration_stats({});
    EXPECT_EQ(stats.count, 0U);
    EXPECT_DOUBLE_EQ(stats.mean, 0.0);
}

TEST(DurationStatsTest, SingleValue) {
    auto stats = compute_duration_stats({3.0});
    EXPECT_EQ(stats.count, 1U);
    EXPECT_DOUBLE_EQ(stats.min, 3.0);
    EXPECT_DOUBLE_EQ(stats.max, 3.0);
    EXPECT_DOUBLE_EQ(stats.median, 3.0);
    EXPECT_DOUBLE_EQ(stats.stddev, 0.0);
    EXPECT_DOUBLE_EQ(stats.percentile_99, 3.0);
}

TEST(DurationStatsTest, UnsortedValues) {
    auto stats = compute_duration_stats({4.0, 1.0, 3.0, 2.0});
    EXPECT_EQ(stats.count, 4U);
    EXPECT_DOUBLE_EQ(stats.min, 1.0);
    EXPECT_DOUBLE_EQ(stats.max, 4.0);
    EXPECT_DOUBLE_EQ(stats.mean, 2.5);
    EXPECT_DOUBLE_EQ(stats.median, 2.5);
    // rank 0.95 * 3 = 2.85 between 3.0 and 4.0
    EXPECT_NEAR(stats.percentile_95, 3.85, 1e-12);
    EXPECT_NEAR(stats.stddev, 1.118033988749895, 1e-12);
}

// =============================================================================
// Ledger metrics
// =============================================================================

TEST(CloudMetricsTest, CountsAndPhases) {
    JobLedger ledger;
    ledger.log(1, "arrival", 0.0);
    ledger.log(1, "qpu_wait_0", 0.5);
    ledger.log(1, "qpu_svc_0", 1.0);
    ledger.log(1, "qpu_turn_0", 1.5);
    ledger.log(1, "qpu_wait_1", 0.0);
    ledger.log(1, "qpu_svc_1", 1.0);
    ledger.log(1, "qpu_turn_1", 1.0);
    ledger.log(1, "cpu_wait_0", 0.25);
    ledger.log(1, "cpu_svc_0", 2.0);
    ledger.log(1, "cpu_turn_0", 2.25);
    ledger.log(1, "fidelity", 0.8);
    ledger.log(1, "fidelity", 0.9);
    ledger.log(1, "makespan", 6.0);

    ledger.log(2, "arrival", 1.0);
    ledger.log(2, "rejected", 1.0);

    ledger.log(3, "arrival", 2.0);

    auto metrics = compute_metrics(ledger);

    EXPECT_EQ(metrics.total_jobs, 3U);
    EXPECT_EQ(metrics.completed_jobs, 1U);
    EXPECT_EQ(metrics.rejected_jobs, 1U);
    EXPECT_EQ(metrics.makespan.count, 1U);
    EXPECT_DOUBLE_EQ(metrics.makespan.mean, 6.0);
    EXPECT_EQ(metrics.qpu.wait.count, 2U);
    EXPECT_DOUBLE_EQ(metrics.qpu.wait.max, 0.5);
    EXPECT_EQ(metrics.qpu.service.count, 2U);
    EXPECT_DOUBLE_EQ(metrics.qpu.turnaround.mean, 1.25);
    EXPECT_EQ(metrics.cpu.service.count, 1U);
    EXPECT_DOUBLE_EQ(metrics.cpu.service.mean, 2.0);
    EXPECT_EQ(metrics.fidelity_samples, 2U);
    EXPECT_NEAR(metrics.mean_fidelity, 0.85, 1e-12);
}

TEST(CloudMetricsTest, PrintRestoresStreamState) {
    JobLedger ledger;
    ledger.log(1, "arrival", 0.0);
    ledger.log(1, "makespan", 2.0);
    auto metrics = compute_metrics(ledger);

    std::ostringstream oss;
    oss << std::setprecision(3);
    print_metrics(metrics, oss);
    std::string report = oss.str();

    EXPECT_NE(report.find("jobs: 1 submitted, 1 completed, 0 rejected"), std::string::npos);
    EXPECT_NE(report.find("makespan"), std::string::npos);
    EXPECT_NE(report.find("n/a"), std::string::npos);
    EXPECT_EQ(report.find("fidelity"), std::string::npos);
    EXPECT_EQ(oss.precision(), 3);
    EXPECT_FALSE(oss.flags() & std::ios::fixed);
}
