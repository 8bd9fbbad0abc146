#include <qcloudsim/algo/job_feed.hpp>
#include <qcloudsim/algo/error.hpp>
#include <qcloudsim/algo/hybrid_cloud.hpp>

#include <qcloudsim/core/engine.hpp>

#include <algorithm>
#include <random>
#include <utility>

namespace qcloudsim::algo {

// =============================================================================
// DispatcherFeed
// =============================================================================

DispatcherFeed::DispatcherFeed(std::vector<core::Job> jobs)
    : jobs_(std::move(jobs)) {}

void DispatcherFeed::start(HybridCloud& cloud) {
    cloud_ = &cloud;
    next_ = 0;
    schedule_next();
}

void DispatcherFeed::schedule_next() {
    if (exhausted()) {
        return;
    }
    auto& engine = cloud_->engine();
    const double wait = core::time_to_units(jobs_[next_].arrival_time) -
                        core::time_to_units(engine.time());
    engine.timeout(core::duration_from_units(std::max(wait, kMinimumGap)), [this] {
        cloud_->submit(jobs_[next_++]);
        schedule_next();
    });
}

// =============================================================================
// GeneratorFeed
// =============================================================================

GeneratorFeed::GeneratorFeed(GeneratorParams params)
    : params_(params) {
    if (params_.arrival_rate <= 0.0) {
        throw ConfigurationError("Arrival rate must be positive");
    }
    if (params_.min_shots > params_.max_shots || params_.min_depth > params_.max_depth ||
        params_.min_qubits > params_.max_qubits || params_.min_priority > params_.max_priority) {
        throw ConfigurationError("Job generator range has min greater than max");
    }
    if (params_.min_qubits == 0 || params_.iterations == 0) {
        throw ConfigurationError("Generated jobs need at least one qubit and one iteration");
    }
}

bool GeneratorFeed::exhausted() const noexcept {
    return params_.max_jobs && generated_ >= *params_.max_jobs;
}

void GeneratorFeed::start(HybridCloud& cloud) {
    cloud_ = &cloud;
    schedule_next();
}

void GeneratorFeed::schedule_next() {
    if (exhausted()) {
        return;
    }
    std::exponential_distribution<double> gap(params_.arrival_rate);
    cloud_->engine().timeout(core::duration_from_units(gap(cloud_->rng())), [this] {
        cloud_->submit(make_job());
        schedule_next();
    });
}

core::Job GeneratorFeed::make_job() {
    auto& rng = cloud_->rng();
    core::Job job;
    job.id = ++generated_;
    job.num_shots = std::uniform_int_distribution<uint64_t>(params_.min_shots, params_.max_shots)(rng);
    job.depth = std::uniform_int_distribution<uint32_t>(params_.min_depth, params_.max_depth)(rng);
    job.num_qubits =
        std::uniform_int_distribution<uint32_t>(params_.min_qubits, params_.max_qubits)(rng);
    job.priority = std::uniform_int_distribution<int>(params_.min_priority, params_.max_priority)(rng);
    job.iterations = params_.iterations;
    return job;
}

// =============================================================================
// run_simulation
// =============================================================================

void run_simulation(HybridCloud& cloud, JobFeed& feed, std::optional<core::TimePoint> until) {
    if (!until && !feed.bounded()) {
        throw ConfigurationError("An unbounded job feed needs a time horizon");
    }
    cloud.start();
    feed.start(cloud);

    auto& engine = cloud.engine();
    if (until) {
        engine.run(*until);
    } else {
        engine.run([&] { return feed.exhausted() && cloud.idle(); });
    }
}

} // namespace qcloudsim::algo
