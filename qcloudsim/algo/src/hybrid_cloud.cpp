#include <qcloudsim/algo/hybrid_cloud.hpp>
#include <qcloudsim/algo/capacity_aware_scheduler.hpp>
#include <qcloudsim/algo/serial_scheduler.hpp>

#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/error.hpp>

#include <algorithm>
#include <utility>

namespace qcloudsim::algo {

HybridCloud::HybridCloud(core::Engine& engine, CloudConfig config)
    : engine_(engine)
    , config_(config)
    , rng_(config.seed) {}

HybridCloud::~HybridCloud() {
    for (auto* device : pool_.all) {
        device->drop_waiters();
    }
    engine_.clear();
}

core::DeviceContext HybridCloud::context() noexcept {
    return core::DeviceContext{engine_, ledger_, bus_, rng_};
}

void HybridCloud::check_new_device(const std::string& name) const {
    if (started()) {
        throw core::InvalidStateError("Cannot add device " + name + " after start()");
    }
    auto same_name = [&name](const auto& device) { return device->name() == name; };
    if (std::any_of(devices_.begin(), devices_.end(), same_name)) {
        throw core::InvalidStateError("Duplicate device name: " + name);
    }
}

core::QuantumDevice& HybridCloud::add_quantum_device(std::string name,
                                                     core::QubitTopology topology,
                                                     core::DeviceProfile profile) {
    check_new_device(name);
    auto device = std::make_unique<core::QuantumDevice>(context(), allocator_, std::move(name),
                                                        std::move(topology), std::move(profile));
    auto& ref = *device;
    devices_.push_back(std::move(device));
    pool_.all.push_back(&ref);
    pool_.quantum.push_back(&ref);
    return ref;
}

core::ComputeDevice& HybridCloud::add_compute_device(std::string name, int64_t cpu_capacity,
                                                     int64_t mem_bw_capacity) {
    check_new_device(name);
    auto device = std::make_unique<core::ComputeDevice>(context(), std::move(name), cpu_capacity,
                                                        mem_bw_capacity);
    auto& ref = *device;
    devices_.push_back(std::move(device));
    pool_.all.push_back(&ref);
    pool_.compute.push_back(&ref);
    return ref;
}

void HybridCloud::start() {
    if (started()) {
        return;
    }
    if (config_.bulk && pool_.quantum.size() < 2) {
        throw ConfigurationError("Bulk allocation needs at least two quantum devices");
    }

    if (config_.scheduler == SchedulerPolicy::Serial) {
        scheduler_ = std::make_unique<SerialScheduler>(engine_, ledger_, pool_, rng_);
    } else {
        if (config_.bulk) {
            bulk_ = std::make_unique<BulkAllocator>(engine_, ledger_, pool_, *config_.bulk);
        }
        scheduler_ = std::make_unique<CapacityAwareScheduler>(engine_, ledger_, pool_, bulk_.get());
    }

    if (config_.maintenance) {
        for (auto* qpu : pool_.quantum) {
            qpu->start_maintenance();
        }
    }
}

Scheduler& HybridCloud::scheduler() {
    if (!scheduler_) {
        throw core::InvalidStateError("HybridCloud::start() has not been called");
    }
    return *scheduler_;
}

const core::Job* HybridCloud::find_job(core::JobId id) const {
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second.get();
}

bool HybridCloud::can_host(const core::Job& job) const noexcept {
    const bool qpu_fits = job.num_qubits <= pool_.max_qubits();
    const bool cpu_fits =
        std::any_of(pool_.compute.begin(), pool_.compute.end(),
                    [&](const core::ComputeDevice* node) { return node->fits(job); });

    if (config_.scheduler == SchedulerPolicy::Serial) {
        return qpu_fits || cpu_fits;
    }
    return cpu_fits && (qpu_fits || bulk_ != nullptr);
}

void HybridCloud::submit(core::Job job) {
    if (!started()) {
        throw core::InvalidStateError("Cannot submit jobs before HybridCloud::start()");
    }
    if (jobs_.count(job.id) != 0) {
        throw core::InvalidStateError("Job id " + std::to_string(job.id) + " submitted twice");
    }

    const core::JobId id = job.id;
    job.arrival_time = engine_.time();
    job.phase = core::JobPhase::Arrived;
    job.iteration = 0;
    auto& stored = *jobs_.emplace(id, std::make_unique<core::Job>(std::move(job))).first->second;

    ledger_.log_time(id, "arrival", engine_.time());
    engine_.trace([&](core::TraceWriter& w) {
        w.type("job_arrival");
        w.field("job_id", static_cast<uint64_t>(id));
        w.field("qubits", static_cast<uint64_t>(stored.num_qubits));
        w.field("iterations", static_cast<uint64_t>(stored.iterations));
    });

    if (!can_host(stored)) {
        ++rejected_;
        ledger_.log_time(id, "rejected", engine_.time());
        engine_.trace([&](core::TraceWriter& w) {
            w.type("job_rejected");
            w.field("job_id", static_cast<uint64_t>(id));
        });
        return;
    }

    ++active_;
    scheduler_->run(stored, [this, id] { job_done(id); });
}

void HybridCloud::job_done(core::JobId id) {
    --active_;
    ++completed_;
    engine_.trace([&](core::TraceWriter& w) {
        w.type("job_completed");
        w.field("job_id", static_cast<uint64_t>(id));
    });
}

} // namespace qcloudsim::algo
