#include <qcloudsim/core/device.hpp>
#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/event_bus.hpp>
#include <qcloudsim/core/job.hpp>
#include <qcloudsim/core/job_ledger.hpp>

#include <utility>

namespace qcloudsim::core {

Device::Device(DeviceContext context, std::string name)
    : ctx_(context)
    , name_(std::move(name))
    , mutex_(context.engine) {}

void Device::drop_waiters() {
    mutex_.drop_waiters();
}

void Device::notify(std::string_view event_type, const Job& job) {
    DeviceEvent payload{name_, job.id, round4(time_to_units(ctx_.engine.time()))};
    ctx_.engine.trace([&](TraceWriter& w) {
        w.type(event_type);
        w.field("device", name_);
        w.field("job_id", static_cast<uint64_t>(job.id));
    });
    ctx_.bus.publish(event_type, payload);
}

} // namespace qcloudsim::core
