#include <qcloudsim/algo/bulk_allocator.hpp>
#include <qcloudsim/algo/hybrid_cloud.hpp>

#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/error.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace qcloudsim;
using namespace qcloudsim::algo;

namespace {

core::DeviceProfile scored(double single_qubit, double readout, double score) {
    core::DeviceProfile profile;
    profile.model = "scored";
    profile.process_time = 1.0;
    profile.errors = core::ErrorProfile{single_qubit, readout, score};
    profile.error_score = score;
    return profile;
}

core::Job make_job(core::JobId id, uint32_t qubits, uint32_t depth = 4) {
    core::Job job;
    job.id = id;
    job.num_qubits = qubits;
    job.depth = depth;
    job.num_shots = 1000;
    return job;
}

} // namespace

class BulkAllocatorTest : public ::testing::Test {
protected:
    void build(std::optional<BulkPolicy> policy, std::vector<std::size_t> sizes = {5, 5, 5}) {
        cloud = std::make_unique<HybridCloud>(engine, CloudConfig{SchedulerPolicy::CapacityAware,
                                                                  policy, 2, false});
        const std::vector<double> scores{0.01, 0.05, 0.02};
        for (std::size_t i = 0; i < sizes.size(); ++i) {
            qpus.push_back(&cloud->add_quantum_device("q" + std::to_string(i),
                                                      core::QubitTopology::ring(sizes[i]),
                                                      scored(0.001 * (i + 1), 0.01, scores[i % 3])));
        }
        cloud->add_compute_device("cpu0");
        cloud->start();
    }

    std::vector<std::string> names(core::JobId id) {
        std::vector<std::string> out;
        if (const auto* list = cloud->ledger().values(id, "devc_name")) {
            for (const auto& value : *list) {
                out.push_back(std::get<std::string>(value));
            }
        }
        return out;
    }

    core::Engine engine;
    std::unique_ptr<HybridCloud> cloud;
    std::vector<core::QuantumDevice*> qpus;
};

TEST_F(BulkAllocatorTest, SmartPicksMinimalPrefixByErrorScore) {
    build(BulkPolicy::Smart);
    BulkAllocator allocator(engine, cloud->ledger(), cloud->devices(), BulkPolicy::Smart);
    core::Job job = make_job(1, 8);

    auto eligible = allocator.eligible_devices(job);
    ASSERT_EQ(eligible.size(), 3U);
    auto shares = allocator.plan(job, eligible);

    // Sorted by score: q0 (0.01), q2 (0.02), q1 (0.05); 5 + 5 covers 8
    ASSERT_EQ(shares.size(), 2U);
    EXPECT_EQ(shares[0].device, qpus[0]);
    EXPECT_EQ(shares[1].device, qpus[2]);
    EXPECT_EQ(shares[0].qubits, 4);
    EXPECT_EQ(shares[1].qubits, 4);
}

TEST_F(BulkAllocatorTest, FastUsesEveryEligibleDevice) {
    build(BulkPolicy::Fast);
    BulkAllocator allocator(engine, cloud->ledger(), cloud->devices(), BulkPolicy::Fast);
    core::Job job = make_job(1, 8);

    auto shares = allocator.plan(job, allocator.eligible_devices(job));

    ASSERT_EQ(shares.size(), 3U);
    EXPECT_EQ(shares[0].device, qpus[0]);
    EXPECT_EQ(shares[0].qubits, 3);
    EXPECT_EQ(shares[1].qubits, 3);
    EXPECT_EQ(shares[2].qubits, 2);
}

TEST_F(BulkAllocatorTest, DevicesWithoutRoomAreNotEligible) {
    build(BulkPolicy::Fast);
    BulkAllocator allocator(engine, cloud->ledger(), cloud->devices(), BulkPolicy::Fast);
    qpus[1]->qubits().acquire(3, [] {});

    auto eligible = allocator.eligible_devices(make_job(1, 8));

    // ceil(8 / 3) = 3 qubits needed per device, q1 has 2 left
    ASSERT_EQ(eligible.size(), 2U);
    EXPECT_EQ(eligible[0], qpus[0]);
    EXPECT_EQ(eligible[1], qpus[2]);
}

TEST_F(BulkAllocatorTest, FidelityModel) {
    build(BulkPolicy::Smart);
    core::Job job = make_job(1, 8, 4);
    std::vector<BulkShare> shares{{qpus[0], 4}, {qpus[2], 4}};

    double first = std::pow(1.0 - 0.001, 4) * std::pow(1.0 - 0.01, 2.0);
    double second = std::pow(1.0 - 0.003, 4) * std::pow(1.0 - 0.01, 2.0);
    double expected = (first + second) / 2.0 * 0.94;
    EXPECT_NEAR(BulkAllocator::fidelity(job, shares), expected, 1e-12);
    EXPECT_DOUBLE_EQ(BulkAllocator::fidelity(job, {}), 0.0);
}

TEST_F(BulkAllocatorTest, SmartRunRecordsDevicesCommunicationAndFidelity) {
    build(BulkPolicy::Smart);

    cloud->submit(make_job(1, 8));
    engine.run([&] { return cloud->idle(); });

    const auto& ledger = cloud->ledger();
    EXPECT_EQ(names(1), (std::vector<std::string>{"q0", "q2", "cpu0"}));
    EXPECT_EQ(ledger.count(1, "devc_proc"), 2U);
    EXPECT_EQ(ledger.count(1, "devc_finish"), 2U);
    ASSERT_EQ(ledger.count(1, "comm_time"), 1U);
    // 0.02 * (4 + 4) + 0.02
    EXPECT_DOUBLE_EQ(*ledger.number(1, "comm_time"), 0.18);
    EXPECT_DOUBLE_EQ(*ledger.number(1, "qpu_finish") - *ledger.number(1, "qpu_start"), 1.18);
    EXPECT_EQ(ledger.count(1, "fidelity"), 1U);
    EXPECT_EQ(ledger.count(1, "makespan"), 1U);

    for (auto* qpu : qpus) {
        EXPECT_EQ(qpu->qubits().level(), 5);
        EXPECT_FALSE(qpu->mutex().locked());
    }
}

TEST_F(BulkAllocatorTest, WaitsUntilTwoDevicesAreEligible) {
    build(BulkPolicy::Fast, {5, 5});
    qpus[1]->qubits().acquire(5, [] {});
    engine.schedule(core::duration_from_units(2.5), [&] { qpus[1]->qubits().release(5); });

    cloud->submit(make_job(1, 8));
    engine.run([&] { return cloud->idle(); });

    const auto& ledger = cloud->ledger();
    EXPECT_DOUBLE_EQ(*ledger.number(1, "qpu_arrive"), 0.0);
    EXPECT_DOUBLE_EQ(*ledger.number(1, "qpu_start"), 3.0);
}

TEST_F(BulkAllocatorTest, SmartWidensPrefixUntilSharesFit) {
    // {q0, q1} covers 9 but splits 5 + 4 with q1 holding only 3; {q0, q1, q2} splits 3 + 3 + 3
    cloud = std::make_unique<HybridCloud>(
        engine, CloudConfig{SchedulerPolicy::CapacityAware, BulkPolicy::Smart, 2, false});
    qpus.push_back(&cloud->add_quantum_device("q0", core::QubitTopology::ring(8), scored(0, 0, 0.01)));
    qpus.push_back(&cloud->add_quantum_device("q1", core::QubitTopology::ring(3), scored(0, 0, 0.02)));
    qpus.push_back(&cloud->add_quantum_device("q2", core::QubitTopology::ring(8), scored(0, 0, 0.03)));
    cloud->add_compute_device("cpu0");
    cloud->start();

    BulkAllocator allocator(engine, cloud->ledger(), cloud->devices(), BulkPolicy::Smart);
    core::Job job = make_job(1, 9);
    auto shares = allocator.plan(job, allocator.eligible_devices(job));

    ASSERT_EQ(shares.size(), 3U);
    EXPECT_TRUE(BulkAllocator::fits(shares));
    for (const auto& share : shares) {
        EXPECT_EQ(share.qubits, 3);
    }

    bool done = false;
    EXPECT_NO_THROW(allocator.allocate(job, [&] { done = true; }));
    engine.run([&] { return done; });
    EXPECT_TRUE(done);
    for (auto* qpu : qpus) {
        EXPECT_EQ(qpu->qubits().level(), qpu->qubits().capacity());
    }
}

TEST_F(BulkAllocatorTest, OversizedSharesWaitForRoomInsteadOfFailing) {
    cloud = std::make_unique<HybridCloud>(
        engine, CloudConfig{SchedulerPolicy::CapacityAware, BulkPolicy::Fast, 2, false});
    auto slow = scored(0, 0, 0.03);
    slow.process_time = 5.0;
    qpus.push_back(&cloud->add_quantum_device("a", core::QubitTopology::ring(60), scored(0, 0, 0.01)));
    qpus.push_back(&cloud->add_quantum_device("b", core::QubitTopology::ring(60), scored(0, 0, 0.02)));
    qpus.push_back(&cloud->add_quantum_device("c", core::QubitTopology::ring(100), slow));
    cloud->add_compute_device("cpu0");
    cloud->start();

    // Job 1 fits on c alone; job 2 then sees only a and b eligible, and 65 + 65 overflows both
    EXPECT_NO_THROW(cloud->submit(make_job(1, 90)));
    EXPECT_NO_THROW(cloud->submit(make_job(2, 130)));
    EXPECT_NO_THROW(engine.run([&] { return cloud->idle(); }));

    EXPECT_EQ(cloud->completed(), 2U);
    const auto& ledger = cloud->ledger();
    EXPECT_EQ(names(1).front(), "c");
    EXPECT_DOUBLE_EQ(*ledger.number(2, "qpu_arrive"), 0.0);
    EXPECT_GE(*ledger.number(2, "qpu_start"), *ledger.number(1, "qpu_finish"));
    EXPECT_EQ(ledger.count(2, "devc_proc"), 3U);
    for (auto* qpu : qpus) {
        EXPECT_EQ(qpu->qubits().level(), qpu->qubits().capacity());
        EXPECT_FALSE(qpu->mutex().locked());
    }
}

TEST_F(BulkAllocatorTest, OversizedJobRejectedWithoutBulkPolicy) {
    build(std::nullopt);

    cloud->submit(make_job(1, 8));

    EXPECT_EQ(cloud->rejected(), 1U);
    EXPECT_TRUE(cloud->idle());
    EXPECT_EQ(cloud->ledger().count(1, "rejected"), 1U);
}

TEST_F(BulkAllocatorTest, BulkPolicyNeedsTwoQuantumDevices) {
    HybridCloud lonely(engine, CloudConfig{SchedulerPolicy::CapacityAware, BulkPolicy::Fast, 0, false});
    lonely.add_quantum_device("q0", core::QubitTopology::ring(5), scored(0, 0, 0));
    lonely.add_compute_device("cpu0");

    EXPECT_THROW(lonely.start(), ConfigurationError);
}
