#include <qcloudsim/algo/phase_metrics.hpp>

#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/job_ledger.hpp>

#include <string>

namespace qcloudsim::algo {

namespace {

void warn_missing(core::Engine& engine, core::JobId job, std::string_view what) {
    engine.trace([&](core::TraceWriter& w) {
        w.type("warning");
        w.field("job_id", static_cast<uint64_t>(job));
        w.field("message", std::string("missing timestamps for ") + std::string(what));
    });
}

} // namespace

bool record_phase_metrics(core::Engine& engine, core::JobLedger& ledger, core::JobId job,
                          std::string_view phase, std::size_t index) {
    const std::string prefix(phase);
    auto arrive = ledger.number(job, prefix + "_arrive", index);
    auto start = ledger.number(job, prefix + "_start", index);
    auto finish = ledger.number(job, prefix + "_finish", index);
    if (!arrive || !start || !finish) {
        warn_missing(engine, job, prefix + " run " + std::to_string(index));
        return false;
    }

    const std::string suffix = "_" + std::to_string(index);
    ledger.log(job, prefix + "_wait" + suffix, core::round4(*start - *arrive));
    ledger.log(job, prefix + "_svc" + suffix, core::round4(*finish - *start));
    ledger.log(job, prefix + "_turn" + suffix, core::round4(*finish - *arrive));
    return true;
}

bool record_makespan(core::Engine& engine, core::JobLedger& ledger, core::JobId job,
                     std::string_view phase) {
    if (ledger.count(job, "makespan") > 0) {
        return false;
    }
    const std::string finish_key = std::string(phase) + "_finish";
    std::size_t finishes = ledger.count(job, finish_key);
    auto arrival = ledger.number(job, "arrival");
    auto last_finish = finishes > 0 ? ledger.number(job, finish_key, finishes - 1)
                                    : std::nullopt;
    if (!arrival || !last_finish) {
        warn_missing(engine, job, "makespan");
        return false;
    }
    ledger.log(job, "makespan", core::round4(*last_finish - *arrival));
    return true;
}

} // namespace qcloudsim::algo
