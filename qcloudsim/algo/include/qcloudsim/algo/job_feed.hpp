#pragma once

#include <qcloudsim/core/job.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace qcloudsim::algo {

class HybridCloud;

/// @brief Source of job arrivals for a HybridCloud.
/// @ingroup algo_feeds
///
/// start() schedules the first arrival; each arrival submits one job to
/// the cloud and schedules the next. exhausted() turns true once no
/// further job will ever be submitted.
class JobFeed {
public:
    virtual void start(HybridCloud& cloud) = 0;
    [[nodiscard]] virtual bool exhausted() const noexcept = 0;

    /// @brief False for feeds that never run out on their own.
    [[nodiscard]] virtual bool bounded() const noexcept { return true; }

    virtual ~JobFeed() = default;
};

/// @brief Replays a predefined job list in order.
/// @ingroup algo_feeds
///
/// Before each job the feed waits `max(arrival_time - now, 0.01)`, so
/// jobs sharing an arrival time are spaced by 0.01 units. The recorded
/// arrival is the submission instant.
class DispatcherFeed : public JobFeed {
public:
    static constexpr double kMinimumGap = 0.01;

    explicit DispatcherFeed(std::vector<core::Job> jobs);

    void start(HybridCloud& cloud) override;
    [[nodiscard]] bool exhausted() const noexcept override { return next_ >= jobs_.size(); }

private:
    void schedule_next();

    HybridCloud* cloud_{nullptr};
    std::vector<core::Job> jobs_;
    std::size_t next_{0};
};

/// @brief Parameters of the random job stream.
/// @ingroup algo_feeds
struct GeneratorParams {
    double arrival_rate{3.0};           ///< Rate of the exponential inter-arrival time.
    uint64_t min_shots{10000};
    uint64_t max_shots{15000};
    uint32_t min_depth{5};
    uint32_t max_depth{20};
    uint32_t min_qubits{5};
    uint32_t max_qubits{20};
    int min_priority{1};
    int max_priority{2};
    uint32_t iterations{1};
    std::optional<std::size_t> max_jobs; ///< Unbounded when empty.
};

/// @brief Endless (or bounded) stream of random jobs.
/// @ingroup algo_feeds
///
/// Each cycle waits an exponential inter-arrival time, then submits a job
/// with ids counting up from 1 and fields drawn uniformly from the
/// parameter ranges, using the cloud's random engine.
class GeneratorFeed : public JobFeed {
public:
    /// @throws ConfigurationError if a range is inverted or the rate is not positive.
    explicit GeneratorFeed(GeneratorParams params);

    void start(HybridCloud& cloud) override;
    [[nodiscard]] bool exhausted() const noexcept override;
    [[nodiscard]] bool bounded() const noexcept override { return params_.max_jobs.has_value(); }

    [[nodiscard]] std::size_t generated() const noexcept { return generated_; }

private:
    void schedule_next();
    [[nodiscard]] core::Job make_job();

    HybridCloud* cloud_{nullptr};
    GeneratorParams params_;
    std::size_t generated_{0};
};

/// @brief Start @p cloud and @p feed and run the engine.
/// @ingroup algo_feeds
///
/// With @p until the engine runs to that time (maintenance processes never
/// end, so this is a hard horizon). Without it the run stops at the first
/// instant where the feed is exhausted and every admitted job is done.
///
/// @throws ConfigurationError if the feed is unbounded and no horizon is given.
void run_simulation(HybridCloud& cloud, JobFeed& feed,
                    std::optional<core::TimePoint> until = std::nullopt);

} // namespace qcloudsim::algo
