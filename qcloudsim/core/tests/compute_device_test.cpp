#include <qcloudsim/core/compute_device.hpp>
#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/error.hpp>
#include <qcloudsim/core/event_bus.hpp>
#include <qcloudsim/core/job.hpp>
#include <qcloudsim/core/job_ledger.hpp>

#include <gtest/gtest.h>

#include <random>
#include <string>
#include <vector>

using namespace qcloudsim::core;

class ComputeDeviceTest : public ::testing::Test {
protected:
    static Job make_job(JobId id) {
        Job job;
        job.id = id;
        job.num_qubits = 5;
        return job;
    }

    Engine engine;
    JobLedger ledger;
    EventBus bus;
    std::mt19937 rng{42};
    ComputeDevice device{DeviceContext{engine, ledger, bus, rng}, "cpu0"};
};

TEST_F(ComputeDeviceTest, DefaultCapacities) {
    EXPECT_EQ(device.kind(), DeviceKind::Compute);
    EXPECT_EQ(device.cpu_units().capacity(), 100);
    EXPECT_EQ(device.mem_bw().capacity(), 200);
    EXPECT_EQ(device.cpu_units().level(), 100);
}

TEST_F(ComputeDeviceTest, SingleJobLifecycle) {
    Job job = make_job(1);
    bool done = false;

    device.process_job(job, [&] { done = true; });

    // Resources are held while the job runs
    EXPECT_LT(device.cpu_units().level(), 100);
    EXPECT_EQ(device.mem_bw().level(), 180);

    engine.run();

    ASSERT_TRUE(done);
    EXPECT_DOUBLE_EQ(*ledger.number(1, "cpu_arrive"), 0.0);
    EXPECT_DOUBLE_EQ(*ledger.number(1, "cpu_start"), 0.0);
    double service = *ledger.number(1, "cpu_finish") - *ledger.number(1, "cpu_start");
    EXPECT_GE(service, 1.0);
    EXPECT_LE(service, 3.0);

    double units = *ledger.number(1, "cpu_units");
    EXPECT_GE(units, 4.0);
    EXPECT_LE(units, 10.0);
    EXPECT_DOUBLE_EQ(*ledger.number(1, "cpu_mem_bw"), 20.0);

    EXPECT_EQ(device.cpu_units().level(), 100);
    EXPECT_EQ(device.mem_bw().level(), 200);
}

TEST_F(ComputeDeviceTest, RecordsDeviceName) {
    Job job = make_job(1);
    device.process_job(job, [] {});
    engine.run();

    const auto* names = ledger.values(1, "devc_name");
    ASSERT_NE(names, nullptr);
    EXPECT_EQ(std::get<std::string>(names->front()), "cpu0");
}

TEST_F(ComputeDeviceTest, PublishesStartAndFinish) {
    std::vector<std::pair<std::string, double>> events;
    bus.subscribe(device_events::start, [&](const DeviceEvent& e) {
        EXPECT_EQ(e.device_name, "cpu0");
        events.emplace_back("start", e.timestamp);
    });
    bus.subscribe(device_events::finish, [&](const DeviceEvent& e) {
        events.emplace_back("finish", e.timestamp);
    });

    Job job = make_job(3);
    device.process_job(job, [] {});
    engine.run();

    ASSERT_EQ(events.size(), 2U);
    EXPECT_EQ(events[0].first, "start");
    EXPECT_EQ(events[1].first, "finish");
    EXPECT_DOUBLE_EQ(events[1].second, *ledger.number(3, "cpu_finish"));
}

TEST_F(ComputeDeviceTest, BandwidthContentionQueuesJobs) {
    ComputeDevice narrow{DeviceContext{engine, ledger, bus, rng}, "narrow", 100, 30};
    Job first = make_job(1);
    Job second = make_job(2);

    narrow.process_job(first, [] {});
    narrow.process_job(second, [] {});
    engine.run();

    // 20 + 20 > 30: the second job starts exactly when the first releases
    EXPECT_DOUBLE_EQ(*ledger.number(2, "cpu_start"), *ledger.number(1, "cpu_finish"));
    EXPECT_EQ(narrow.mem_bw().level(), 30);
    EXPECT_EQ(narrow.cpu_units().level(), 100);
}

TEST_F(ComputeDeviceTest, ExplicitBandwidthDemand) {
    Job job = make_job(1);
    job.mem_bw = 50;
    device.process_job(job, [] {});

    EXPECT_EQ(device.mem_bw().level(), 150);
    engine.run();
    EXPECT_DOUBLE_EQ(*ledger.number(1, "cpu_mem_bw"), 50.0);
}

TEST_F(ComputeDeviceTest, FaultingBandwidthAcquireRollsBackCpu) {
    Job job = make_job(1);
    job.mem_bw = 500;  // exceeds the 200 capacity
    bool done = false;

    EXPECT_THROW(device.process_job(job, [&] { done = true; }), ResourceError);

    EXPECT_FALSE(done);
    EXPECT_EQ(device.cpu_units().level(), 100);
    EXPECT_EQ(device.mem_bw().level(), 200);
}

TEST_F(ComputeDeviceTest, SameSeedSameDraws) {
    Engine other_engine;
    JobLedger other_ledger;
    std::mt19937 other_rng{42};
    ComputeDevice other{DeviceContext{other_engine, other_ledger, bus, other_rng}, "cpu0"};

    Job a = make_job(1);
    Job b = make_job(1);
    device.process_job(a, [] {});
    other.process_job(b, [] {});
    engine.run();
    other_engine.run();

    EXPECT_EQ(*ledger.number(1, "cpu_finish"), *other_ledger.number(1, "cpu_finish"));
    EXPECT_EQ(*ledger.number(1, "cpu_units"), *other_ledger.number(1, "cpu_units"));
}

TEST_F(ComputeDeviceTest, FitsNeedsRoomForLargestDraw) {
    ComputeDevice small{DeviceContext{engine, ledger, bus, rng}, "small", 8};
    ComputeDevice exact{DeviceContext{engine, ledger, bus, rng}, "exact", ComputeDevice::kMaxCpuDraw};
    Job job = make_job(1);

    EXPECT_TRUE(device.fits(job));
    EXPECT_TRUE(exact.fits(job));
    // 8 covers the default demand but not a draw of up to 10 units
    EXPECT_FALSE(small.fits(job));

    job.cpu_units = 12;
    EXPECT_FALSE(exact.fits(job));
    job.cpu_units = 2;
    job.mem_bw = 250;
    EXPECT_FALSE(device.fits(job));
}
