#pragma once

#include <qcloudsim/core/types.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace qcloudsim::core {

/// @brief Payload of a device lifecycle notification.
/// @ingroup core_events
struct DeviceEvent {
    std::string device_name;
    JobId job_id{0};
    double timestamp{0.0};
};

/// @brief Notification types emitted by the device processes.
/// @ingroup core_events
namespace device_events {
inline constexpr std::string_view start = "device_start";
inline constexpr std::string_view finish = "device_finish";
} // namespace device_events

/// @brief Synchronous in-process publish/subscribe fan-out.
///
/// publish() invokes every subscriber of the event type in subscription
/// order before returning. Delivery is best-effort: nothing is stored for
/// late subscribers and nothing is retried.
///
/// @ingroup core_events
class EventBus {
public:
    using Callback = std::function<void(const DeviceEvent&)>;

    void subscribe(std::string_view event_type, Callback callback);
    void publish(std::string_view event_type, const DeviceEvent& payload) const;

    /// @brief Number of subscribers registered for @p event_type.
    [[nodiscard]] std::size_t subscriber_count(std::string_view event_type) const;

private:
    std::map<std::string, std::vector<Callback>, std::less<>> subscribers_;
};

} // namespace qcloudsim::core
