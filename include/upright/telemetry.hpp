#pragma once

#include "upright/sensor_encoder.hpp"
#include "upright/action_policy.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace upright {

// Per control tick display data
struct TelemetrySnapshot {
    uint64_t tick = 0;
    std::vector<float> sensors;   // leading sensor values
    GroundContact contact;
    float fitness = 0.0f;
    double explorationRate = 0.0;
    PolicyMode mode = PolicyMode::Explore;
};

// Latest-wins mailbox between the control loop and a display thread
class TelemetryChannel {
public:
    void publish(TelemetrySnapshot snapshot) {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_ = std::move(snapshot);
    }

    std::optional<TelemetrySnapshot> latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return latest_;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_.reset();
    }

private:
    mutable std::mutex mutex_;
    std::optional<TelemetrySnapshot> latest_;
};

} // namespace upright
