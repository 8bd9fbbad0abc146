#pragma once

#include <qcloudsim/core/types.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace qcloudsim::core {

/// @brief One recorded value: a number (timestamp, metric, count) or a name.
/// @ingroup core_ledger
using RecordValue = std::variant<double, std::string>;

/// @brief All entries of one job, keyed by event or metric name.
///
/// Every key maps to the list of values logged under it, in logging order.
/// A key logged once holds a single value; a key logged on every
/// iteration (such as `qpu_start`) holds one value per iteration.
///
/// @ingroup core_ledger
using JobRecord = std::map<std::string, std::vector<RecordValue>, std::less<>>;

/// @brief Round @p value to 4 decimals, the precision of every ledger time.
[[nodiscard]] double round4(double value) noexcept;

/// @brief Append-only store of per-job events and derived metrics.
///
/// A job's record is created by its first logged event and is never
/// removed during a run. Consumers read it through records() and find();
/// only the simulation writes to it.
///
/// @ingroup core_ledger
class JobLedger {
public:
    /// @brief Append @p value under @p key for @p job.
    void log(JobId job, std::string_view key, RecordValue value);

    /// @brief Append a timestamp (in units, rounded to 4 decimals).
    void log_time(JobId job, std::string_view key, TimePoint time);

    /// @brief Record of @p job, or nullptr if nothing was logged for it.
    [[nodiscard]] const JobRecord* find(JobId job) const;

    /// @brief Values logged under @p key, or nullptr if none.
    [[nodiscard]] const std::vector<RecordValue>* values(JobId job, std::string_view key) const;

    /// @brief The @p index-th value under @p key if it exists and is numeric.
    [[nodiscard]] std::optional<double> number(JobId job, std::string_view key,
                                               std::size_t index = 0) const;

    /// @brief Number of values logged under @p key for @p job.
    [[nodiscard]] std::size_t count(JobId job, std::string_view key) const;

    /// @brief Full read-only view, ordered by job id.
    [[nodiscard]] const std::map<JobId, JobRecord>& records() const noexcept { return records_; }

    [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

private:
    std::map<JobId, JobRecord> records_;
};

} // namespace qcloudsim::core
