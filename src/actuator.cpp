#include "upright/actuator.hpp"
#include "upright/log.hpp"
#include <algorithm>
#include <cmath>
#include <exception>

namespace upright {

Actuator::Actuator(const BodyPlan& plan, const ActuationConfig& config)
    : motors_(plan.motors()),
      config_(config),
      strength_(config.motorStrength > 0.0 ? config.motorStrength : plan.defaultMotorStrength()) {}

Eigen::Vector3d Actuator::torqueFor(int index, float value) const {
    return motors_[index].axisScale * (static_cast<double>(value) * strength_);
}

int Actuator::apply(const BodyRig& rig, const Eigen::VectorXf& command) {
    int applied = 0;
    const int count = std::min<int>(static_cast<int>(motors_.size()), static_cast<int>(command.size()));

    for (int i = 0; i < count; ++i) {
        const float value = command[i];
        if (!std::isfinite(value) || std::abs(value) <= config_.deadband) continue;

        BodyHandle* body = rig.live(motors_[i].part);
        if (body == nullptr) continue;

        try {
            body->addTorque(torqueFor(i, value), true);
            ++applied;
        } catch (const std::exception& e) {
            ++failures_;
            LOG_WARN("[Actuator] Dropping " << motors_[i].part << " command: " << e.what());
        }
    }
    return applied;
}

} // namespace upright
