#include <qcloudsim/core/job_ledger.hpp>

#include <cmath>
#include <utility>

namespace qcloudsim::core {

double round4(double value) noexcept {
    return std::round(value * 1e4) / 1e4;
}

void JobLedger::log(JobId job, std::string_view key, RecordValue value) {
    auto& record = records_[job];
    auto it = record.find(key);
    if (it == record.end()) {
        it = record.emplace(std::string(key), std::vector<RecordValue>{}).first;
    }
    it->second.push_back(std::move(value));
}

void JobLedger::log_time(JobId job, std::string_view key, TimePoint time) {
    log(job, key, round4(time_to_units(time)));
}

const JobRecord* JobLedger::find(JobId job) const {
    auto it = records_.find(job);
    return it == records_.end() ? nullptr : &it->second;
}

const std::vector<RecordValue>* JobLedger::values(JobId job, std::string_view key) const {
    const JobRecord* record = find(job);
    if (record == nullptr) {
        return nullptr;
    }
    auto it = record->find(key);
    return it == record->end() ? nullptr : &it->second;
}

std::optional<double> JobLedger::number(JobId job, std::string_view key,
                                        std::size_t index) const {
    const auto* list = values(job, key);
    if (list == nullptr || index >= list->size()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<double>(&(*list)[index])) {
        return *value;
    }
    return std::nullopt;
}

std::size_t JobLedger::count(JobId job, std::string_view key) const {
    const auto* list = values(job, key);
    return list == nullptr ? 0 : list->size();
}

} // namespace qcloudsim::core
