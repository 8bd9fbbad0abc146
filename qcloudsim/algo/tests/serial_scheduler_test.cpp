#include <qcloudsim/algo/hybrid_cloud.hpp>
#include <qcloudsim/algo/serial_scheduler.hpp>

#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/error.hpp>
#include <qcloudsim/core/maintenance.hpp>

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <variant>

using namespace qcloudsim;
using namespace qcloudsim::algo;

namespace {

core::DeviceProfile fixed_time(double units) {
    core::DeviceProfile profile;
    profile.model = "fixed";
    profile.process_time = units;
    return profile;
}

core::Job make_job(core::JobId id, uint32_t qubits) {
    core::Job job;
    job.id = id;
    job.num_qubits = qubits;
    job.iterations = 4;  // ignored by the serial strategy
    return job;
}

CloudConfig serial_config(uint32_t seed = 3, bool maintenance = false) {
    return CloudConfig{SchedulerPolicy::Serial, std::nullopt, seed, maintenance};
}

} // namespace

TEST(SerialSchedulerTest, RunsOnePhaseOnOneDevice) {
    core::Engine engine;
    HybridCloud cloud(engine, serial_config());
    cloud.add_quantum_device("qpu0", core::QubitTopology::ring(5), fixed_time(2.0));
    cloud.start();
    EXPECT_EQ(cloud.scheduler().name(), "serial");

    cloud.submit(make_job(1, 3));
    engine.run([&] { return cloud.idle(); });

    const auto& ledger = cloud.ledger();
    EXPECT_EQ(ledger.count(1, "qpu_start"), 1U);
    EXPECT_EQ(ledger.count(1, "cpu_start"), 0U);
    EXPECT_DOUBLE_EQ(*ledger.number(1, "qpu_svc_0"), 2.0);
    EXPECT_DOUBLE_EQ(*ledger.number(1, "makespan"), 2.0);
    EXPECT_EQ(cloud.find_job(1)->phase, core::JobPhase::Done);
    EXPECT_EQ(cloud.completed(), 1U);
}

TEST(SerialSchedulerTest, MutexSerialisesJobsOnADevice) {
    core::Engine engine;
    HybridCloud cloud(engine, serial_config());
    cloud.add_quantum_device("qpu0", core::QubitTopology::line(10), fixed_time(2.0));
    cloud.start();

    // Both fit side by side, yet the device mutex runs them one after another
    cloud.submit(make_job(1, 3));
    cloud.submit(make_job(2, 3));
    engine.run([&] { return cloud.idle(); });

    const auto& ledger = cloud.ledger();
    EXPECT_DOUBLE_EQ(*ledger.number(1, "qpu_start"), 0.0);
    EXPECT_DOUBLE_EQ(*ledger.number(2, "qpu_start"), *ledger.number(1, "qpu_finish"));
    EXPECT_DOUBLE_EQ(*ledger.number(2, "makespan"), 4.0);
    EXPECT_FALSE(cloud.devices().quantum[0]->mutex().locked());
}

TEST(SerialSchedulerTest, TooSmallQpuIsNeverChosen) {
    core::Engine engine;
    HybridCloud cloud(engine, serial_config(9));
    cloud.add_quantum_device("qpu0", core::QubitTopology::ring(5), fixed_time(1.0));
    cloud.add_compute_device("cpu0");
    cloud.start();

    for (core::JobId id = 1; id <= 10; ++id) {
        cloud.submit(make_job(id, 8));
    }
    engine.run([&] { return cloud.idle(); });

    for (core::JobId id = 1; id <= 10; ++id) {
        const auto* names = cloud.ledger().values(id, "devc_name");
        ASSERT_NE(names, nullptr);
        EXPECT_EQ(std::get<std::string>(names->front()), "cpu0");
    }
}

TEST(SerialSchedulerTest, ComputeNodeTooSmallForLargestDrawIsNeverChosen) {
    core::Engine engine;
    HybridCloud cloud(engine, serial_config(11));
    cloud.add_quantum_device("qpu0", core::QubitTopology::ring(5), fixed_time(1.0));
    cloud.add_compute_device("small", 8);
    cloud.add_compute_device("big");
    cloud.start();

    std::set<std::string> used;
    core::Job job = make_job(1, 2);
    for (int i = 0; i < 50; ++i) {
        used.insert(cloud.scheduler().select_device(job)->name());
    }
    EXPECT_EQ(used, (std::set<std::string>{"qpu0", "big"}));
}

TEST(SerialSchedulerTest, RandomSelectionUsesEveryHost) {
    core::Engine engine;
    HybridCloud cloud(engine, serial_config(5));
    cloud.add_quantum_device("qpu0", core::QubitTopology::ring(5), fixed_time(1.0));
    cloud.add_compute_device("cpu0");
    cloud.start();

    std::set<std::string> used;
    core::Job job = make_job(1, 2);
    for (int i = 0; i < 50; ++i) {
        used.insert(cloud.scheduler().select_device(job)->name());
    }
    EXPECT_EQ(used, (std::set<std::string>{"qpu0", "cpu0"}));
}

TEST(SerialSchedulerTest, WaitsForMaintenanceWindow) {
    core::Engine engine;
    HybridCloud cloud(engine, serial_config(4, true));
    core::DeviceProfile profile = fixed_time(1.0);
    profile.maintenance = core::MaintenanceParams{true, 10.0, 5.0};
    auto& qpu = cloud.add_quantum_device("qpu0", core::QubitTopology::ring(5), profile);
    cloud.start();
    ASSERT_NE(qpu.maintenance(), nullptr);

    engine.run([&] { return qpu.under_maintenance(); });
    const double window_start = core::time_to_units(engine.time());
    cloud.submit(make_job(1, 2));
    engine.run([&] { return cloud.idle(); });

    EXPECT_DOUBLE_EQ(*cloud.ledger().number(1, "qpu_start"), core::round4(window_start + 5.0));
}

TEST(SerialSchedulerTest, NoHostThrows) {
    core::Engine engine;
    core::JobLedger ledger;
    DevicePool empty;
    std::mt19937 rng{1};
    SerialScheduler scheduler(engine, ledger, empty, rng);

    core::Job job = make_job(1, 2);
    EXPECT_EQ(scheduler.select_device(job), nullptr);
    EXPECT_THROW(scheduler.run(job, [] {}), core::InvalidStateError);
}
