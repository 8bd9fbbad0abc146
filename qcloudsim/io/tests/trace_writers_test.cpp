#include <qcloudsim/io/trace_writers.hpp>

#include <qcloudsim/core/engine.hpp>

#include <gtest/gtest.h>

#include <rapidjson/document.h>

#include <sstream>
#include <string>
#include <variant>

using namespace qcloudsim::io;
using namespace qcloudsim::core;

class TraceWritersTest : public ::testing::Test {
protected:
    TimePoint time(double units) {
        return time_from_units(units);
    }
};

// =============================================================================
// NullTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, NullWriterAcceptsAllCalls) {
    NullTraceWriter writer;

    writer.begin(time(0.0));
    writer.type("job_arrival");
    writer.field("job_id", uint64_t{42});
    writer.field("fidelity", 0.93);
    writer.field("device", "qpu0");
    writer.end();
}

// =============================================================================
// JsonTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, JsonWriterEmptyArray) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
    }
    EXPECT_EQ(oss.str(), "[]\n");
}

TEST_F(TraceWritersTest, JsonWriterRecordsParseBack) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.begin(time(1.5));
        writer.type("device_start");
        writer.field("job_id", uint64_t{10});
        writer.field("device", "q0");
        writer.end();

        writer.begin(time(2.25));
        writer.type("bulk_allocation");
        writer.field("ratio", 0.5);
        writer.end();
    }

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 2U);

    EXPECT_DOUBLE_EQ(doc[0]["time"].GetDouble(), 1.5);
    EXPECT_STREQ(doc[0]["type"].GetString(), "device_start");
    EXPECT_EQ(doc[0]["job_id"].GetUint64(), 10U);
    EXPECT_STREQ(doc[0]["device"].GetString(), "q0");
    EXPECT_DOUBLE_EQ(doc[1]["ratio"].GetDouble(), 0.5);
}

TEST_F(TraceWritersTest, JsonWriterFinalizeIsIdempotent) {
    std::ostringstream oss;
    {
        JsonTraceWriter writer(oss);
        writer.finalize();
        writer.finalize();
    }
    EXPECT_EQ(oss.str(), "[]\n");
}

// =============================================================================
// MemoryTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, MemoryWriterCollectsFromEngine) {
    Engine engine;
    MemoryTraceWriter writer;
    engine.set_trace_writer(&writer);

    engine.timeout(duration_from_units(2.0), [&] {
        engine.trace([](TraceWriter& w) {
            w.type("maintenance_start");
            w.field("device", "q1");
        });
    });
    engine.run();

    ASSERT_EQ(writer.records().size(), 1U);
    const auto& record = writer.records().front();
    EXPECT_DOUBLE_EQ(record.time, 2.0);
    EXPECT_EQ(record.type, "maintenance_start");
    EXPECT_EQ(std::get<std::string>(record.fields.at("device")), "q1");
}

TEST_F(TraceWritersTest, MemoryWriterFiltersAndClears) {
    MemoryTraceWriter writer;
    for (int i = 0; i < 3; ++i) {
        writer.begin(time(i));
        writer.type(i == 1 ? "job_rejected" : "job_arrival");
        writer.field("job_id", static_cast<uint64_t>(i));
        writer.end();
    }

    auto arrivals = writer.records_of("job_arrival");
    ASSERT_EQ(arrivals.size(), 2U);
    EXPECT_EQ(std::get<uint64_t>(arrivals[1].fields.at("job_id")), 2U);

    writer.clear();
    EXPECT_TRUE(writer.records().empty());
}

// =============================================================================
// TextualTraceWriter Tests
// =============================================================================

TEST_F(TraceWritersTest, TextualWriterFormatsLines) {
    std::ostringstream oss;
    TextualTraceWriter writer(oss);

    writer.begin(time(1.0));
    writer.type("device_start");
    writer.field("device", "q0");
    writer.field("job_id", uint64_t{3});
    writer.end();

    writer.begin(time(3.5));
    writer.type("device_finish");
    writer.end();

    std::istringstream lines(oss.str());
    std::string first;
    std::string second;
    std::getline(lines, first);
    std::getline(lines, second);

    EXPECT_NE(first.find("[      1.0000]"), std::string::npos);
    EXPECT_NE(first.find("device_start: device = q0, job_id = 3"), std::string::npos);
    EXPECT_NE(second.find("[      3.5000]"), std::string::npos);
    EXPECT_NE(second.find("(+    2.5000)"), std::string::npos);
}
