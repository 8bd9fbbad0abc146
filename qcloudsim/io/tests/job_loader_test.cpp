#include <qcloudsim/io/error.hpp>
#include <qcloudsim/io/job_loader.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace qcloudsim::io;
using namespace qcloudsim::core;

namespace {

std::string csv_error(const char* csv) {
    try {
        (void)load_jobs_from_csv_string(csv);
    } catch (const LoaderError& e) {
        return e.what();
    }
    return {};
}

} // namespace

// =============================================================================
// CSV
// =============================================================================

TEST(JobLoaderTest, CsvRequiredColumns) {
    auto jobs = load_jobs_from_csv_string(
        "job_id,num_qubits,depth,num_shots,priority\n"
        "1,5,10,1000,1\n"
        "2,8,3,2000,2\n");

    ASSERT_EQ(jobs.size(), 2U);
    EXPECT_EQ(jobs[0].id, 1U);
    EXPECT_EQ(jobs[0].num_qubits, 5U);
    EXPECT_EQ(jobs[0].depth, 10U);
    EXPECT_EQ(jobs[0].num_shots, 1000U);
    EXPECT_EQ(jobs[1].priority, 2);
    EXPECT_EQ(jobs[1].arrival_time, TimePoint{});
    EXPECT_EQ(jobs[1].iterations, 1U);
    EXPECT_FALSE(jobs[1].cpu_units.has_value());
}

TEST(JobLoaderTest, CsvColumnOrderAndOptionalFields) {
    auto jobs = load_jobs_from_csv_string(
        "priority, arrival_time, job_id, num_qubits, depth, num_shots, iterations, cpu_units, mem_bw\r\n"
        "\r\n"
        "1, 2.5, 9, 3, 4, 100, 3, 12, 40\r\n"
        "2, , 4, 3, 4, 100, , ,\r\n");

    ASSERT_EQ(jobs.size(), 2U);
    EXPECT_EQ(jobs[0].id, 9U);
    EXPECT_EQ(jobs[0].arrival_time, time_from_units(2.5));
    EXPECT_EQ(jobs[0].iterations, 3U);
    EXPECT_EQ(jobs[0].cpu_units, 12);
    EXPECT_EQ(jobs[0].mem_bw, 40);
    // File order is kept even when ids are not sorted
    EXPECT_EQ(jobs[1].id, 4U);
    EXPECT_EQ(jobs[1].arrival_time, TimePoint{});
    EXPECT_EQ(jobs[1].iterations, 1U);
    EXPECT_FALSE(jobs[1].mem_bw.has_value());
}

TEST(JobLoaderTest, CsvErrors) {
    EXPECT_EQ(csv_error(""), "csv: missing header row");
    EXPECT_EQ(csv_error("job_id,num_qubits,depth,num_shots\n"),
              "csv header: missing required column 'priority'");
    EXPECT_EQ(csv_error("job_id,num_qubits,depth,num_shots,priority\n1,0,1,1,1\n"),
              "line 2: field 'num_qubits' must be >= 1");
    EXPECT_EQ(csv_error("job_id,num_qubits,depth,num_shots,priority\n1,2,1,1\n"),
              "line 2: missing required field 'priority'");
    EXPECT_EQ(csv_error("job_id,num_qubits,depth,num_shots,priority\n1,2,1,1,1,7\n"),
              "line 2: too many fields (6 for 5 columns)");
    EXPECT_EQ(csv_error("job_id,num_qubits,depth,num_shots,priority\nx,2,1,1,1\n"),
              "line 2: field 'job_id' must be a non-negative integer");
    EXPECT_EQ(csv_error("job_id,num_qubits,depth,num_shots,priority,arrival_time\n1,2,1,1,1,-1\n"),
              "line 2: arrival_time must be non-negative");
    EXPECT_EQ(csv_error("job_id,num_qubits,depth,num_shots,priority\n1,2,1,1,1\n1,2,1,1,1\n"),
              "jobs[1]: duplicate job_id 1");
}

// =============================================================================
// JSON
// =============================================================================

TEST(JobLoaderTest, JsonJobs) {
    auto jobs = load_jobs_from_json_string(R"({
        "jobs": [
            {"job_id": 3, "num_qubits": 6, "depth": 2, "num_shots": 500, "priority": 1,
             "arrival_time": 1.5, "iterations": 2},
            {"job_id": "4", "num_qubits": 2, "depth": 1, "num_shots": 10, "priority": 2,
             "mem_bw": null}
        ]
    })");

    ASSERT_EQ(jobs.size(), 2U);
    EXPECT_EQ(jobs[0].id, 3U);
    EXPECT_EQ(jobs[0].arrival_time, time_from_units(1.5));
    EXPECT_EQ(jobs[0].iterations, 2U);
    EXPECT_EQ(jobs[1].id, 4U);
    EXPECT_FALSE(jobs[1].mem_bw.has_value());
}

TEST(JobLoaderTest, JsonErrors) {
    EXPECT_THROW((void)load_jobs_from_json_string("{"), LoaderError);
    EXPECT_THROW((void)load_jobs_from_json_string("[]"), LoaderError);
    EXPECT_THROW((void)load_jobs_from_json_string(R"({"jobs": {}})"), LoaderError);
    try {
        (void)load_jobs_from_json_string(R"({"jobs": [{"job_id": 1, "num_qubits": 1,
            "depth": 1, "num_shots": 1, "priority": [1]}]})");
        FAIL() << "expected LoaderError";
    } catch (const LoaderError& e) {
        EXPECT_STREQ(e.what(), "jobs[0]: field 'priority' must be a number");
    }
}

// =============================================================================
// Files
// =============================================================================

TEST(JobLoaderTest, DispatchesOnExtension) {
    auto dir = std::filesystem::temp_directory_path();
    auto csv = dir / "qcloudsim_job_loader_test.CSV";
    auto json = dir / "qcloudsim_job_loader_test.json";
    {
        std::ofstream(csv) << "job_id,num_qubits,depth,num_shots,priority\n1,2,3,4,1\n";
        std::ofstream(json) << R"({"jobs": [{"job_id": 1, "num_qubits": 2, "depth": 3,
                                  "num_shots": 4, "priority": 1}]})";
    }

    EXPECT_EQ(load_jobs(csv).size(), 1U);
    EXPECT_EQ(load_jobs(json).size(), 1U);
    std::filesystem::remove(csv);
    std::filesystem::remove(json);
}

TEST(JobLoaderTest, RejectsUnknownExtensionAndMissingFile) {
    EXPECT_THROW((void)load_jobs("jobs.txt"), LoaderError);
    EXPECT_THROW((void)load_jobs("/nonexistent/jobs.csv"), LoaderError);
}
