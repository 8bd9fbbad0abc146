#include <qcloudsim/algo/bulk_allocator.hpp>

#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/job.hpp>
#include <qcloudsim/core/job_ledger.hpp>
#include <qcloudsim/core/topology_allocator.hpp>

#include <algorithm>
#include <cmath>
#include <span>
#include <utility>

namespace qcloudsim::algo {

BulkAllocator::BulkAllocator(core::Engine& engine, core::JobLedger& ledger,
                             const DevicePool& devices, BulkPolicy policy)
    : engine_(engine)
    , ledger_(ledger)
    , devices_(devices)
    , policy_(policy) {}

std::vector<core::QuantumDevice*> BulkAllocator::eligible_devices(const core::Job& job) const {
    std::vector<core::QuantumDevice*> eligible;
    const std::size_t count = devices_.quantum.size();
    if (count == 0) {
        return eligible;
    }
    const std::size_t per_device = (job.num_qubits + count - 1) / count;

    for (auto* qpu : devices_.quantum) {
        if (qpu->under_maintenance() ||
            qpu->qubits().level() < static_cast<int64_t>(per_device)) {
            continue;
        }
        if (qpu->allocator().select(qpu->topology(), per_device)) {
            eligible.push_back(qpu);
        }
    }
    return eligible;
}

namespace {

std::vector<BulkShare> split_evenly(int64_t required, std::span<core::QuantumDevice* const> devices) {
    std::vector<BulkShare> shares;
    const auto count = std::min<int64_t>(static_cast<int64_t>(devices.size()), required);
    if (count <= 0) {
        return shares;
    }
    const int64_t split = required / count;
    const int64_t remainder = required % count;
    for (int64_t i = 0; i < count; ++i) {
        shares.push_back(BulkShare{devices[static_cast<std::size_t>(i)],
                                   split + (i < remainder ? 1 : 0)});
    }
    return shares;
}

} // namespace

std::vector<BulkShare> BulkAllocator::plan(const core::Job& job,
                                           std::vector<core::QuantumDevice*> eligible) const {
    const auto required = static_cast<int64_t>(job.num_qubits);

    if (policy_ == BulkPolicy::Smart) {
        std::stable_sort(eligible.begin(), eligible.end(),
                         [](const core::QuantumDevice* a, const core::QuantumDevice* b) {
                             return a->profile().score() < b->profile().score();
                         });
        int64_t covered = 0;
        for (std::size_t prefix = 1; prefix <= eligible.size(); ++prefix) {
            covered += eligible[prefix - 1]->qubits().level();
            if (covered < required) {
                continue;
            }
            auto shares = split_evenly(required, std::span(eligible).first(prefix));
            if (fits(shares)) {
                return shares;
            }
        }
    }
    return split_evenly(required, eligible);
}

bool BulkAllocator::fits(std::span<const BulkShare> shares) noexcept {
    return std::all_of(shares.begin(), shares.end(), [](const BulkShare& share) {
        return share.qubits <= share.device->qubits().level();
    });
}

double BulkAllocator::fidelity(const core::Job& job, std::span<const BulkShare> shares) {
    if (shares.empty()) {
        return 0.0;
    }
    const double per_device = static_cast<double>(job.num_qubits / shares.size());
    double sum = 0.0;
    for (const auto& share : shares) {
        const auto& errors = share.device->profile().errors;
        double gates = std::pow(1.0 - errors.single_qubit, static_cast<double>(job.depth));
        double readout = std::pow(1.0 - errors.readout, std::sqrt(per_device));
        sum += gates * readout;
    }
    double mean = sum / static_cast<double>(shares.size());
    return mean * std::pow(kCommPenalty, static_cast<double>(shares.size() - 1));
}

void BulkAllocator::allocate(core::Job& job, Completion on_done) {
    ledger_.log_time(job.id, "qpu_arrive", engine_.time());
    auto run = std::make_shared<Run>();
    run->job = &job;
    run->done = std::move(on_done);
    wait_for_devices(run);
}

void BulkAllocator::wait_for_devices(const std::shared_ptr<Run>& run) {
    auto eligible = eligible_devices(*run->job);
    if (eligible.size() < 2) {
        engine_.timeout(core::duration_from_units(kRetryInterval),
                        [this, run] { wait_for_devices(run); });
        return;
    }

    auto shares = plan(*run->job, std::move(eligible));
    if (!fits(shares)) {
        engine_.timeout(core::duration_from_units(kRetryInterval),
                        [this, run] { wait_for_devices(run); });
        return;
    }
    run->shares = std::move(shares);
    engine_.trace([&](core::TraceWriter& w) {
        w.type("bulk_allocation");
        w.field("job_id", static_cast<uint64_t>(run->job->id));
        w.field("policy", policy_ == BulkPolicy::Smart ? "smart" : "fast");
        w.field("devices", static_cast<uint64_t>(run->shares.size()));
    });
    acquire_next(run);
}

void BulkAllocator::acquire_next(const std::shared_ptr<Run>& run) {
    if (run->acquired == run->shares.size()) {
        ledger_.log_time(run->job->id, "qpu_start", engine_.time());
        communicate(run);
        return;
    }

    const BulkShare share = run->shares[run->acquired];
    share.device->mutex().request(kMutexPriority, [this, run, share](core::PriorityMutex::Lock lock) {
        run->lock = std::move(lock);
        try {
            share.device->qubits().acquire(share.qubits, [this, run, share] {
                run->lock.reset();
                ledger_.log(run->job->id, "devc_name", share.device->name());
                ledger_.log_time(run->job->id, "devc_proc", engine_.time());
                ++run->acquired;
                acquire_next(run);
            });
        } catch (...) {
            run->lock.reset();
            roll_back(run);
            throw;
        }
    });
}

void BulkAllocator::roll_back(const std::shared_ptr<Run>& run) {
    // Shares [0, acquired) are held; clearing the count keeps nested unwinds from repeating this
    const std::size_t held = std::exchange(run->acquired, 0);
    for (std::size_t i = 0; i < held; ++i) {
        run->shares[i].device->qubits().release(run->shares[i].qubits);
    }
}

void BulkAllocator::communicate(const std::shared_ptr<Run>& run) {
    if (run->next_pair + 1 >= run->shares.size()) {
        execute(run);
        return;
    }
    const auto& first = run->shares[run->next_pair];
    const auto& second = run->shares[run->next_pair + 1];
    const double delay =
        kCommDelayPerQubit * static_cast<double>(first.qubits + second.qubits) + kFeedbackDelay;
    ledger_.log(run->job->id, "comm_time", core::round4(delay));
    ++run->next_pair;
    engine_.timeout(core::duration_from_units(delay), [this, run] { communicate(run); });
}

void BulkAllocator::execute(const std::shared_ptr<Run>& run) {
    core::Duration longest = core::Duration::zero();
    for (const auto& share : run->shares) {
        longest = std::max(longest, share.device->processing_time(*run->job));
    }
    engine_.timeout(longest, [this, run] { finish(run); });
}

void BulkAllocator::finish(const std::shared_ptr<Run>& run) {
    const core::Job& job = *run->job;
    for (const auto& share : run->shares) {
        share.device->qubits().release(share.qubits);
        ledger_.log_time(job.id, "devc_finish", engine_.time());
    }
    run->acquired = 0;

    ledger_.log_time(job.id, "qpu_finish", engine_.time());
    ledger_.log(job.id, "fidelity", core::round4(fidelity(job, run->shares)));

    Completion done = std::move(run->done);
    done();
}

} // namespace qcloudsim::algo
