#pragma once

#include "upright/body_plan.hpp"
#include "upright/physics.hpp"
#include <Eigen/Dense>
#include <vector>

namespace upright {

struct ActuationConfig {
    double motorStrength = 0.0;   // <= 0 uses the body plan's default
    double deadband = 0.02;       // commands with |value| <= deadband are not applied
};

// Maps an action vector onto world-frame torques, one motor per body part.
class Actuator {
public:
    Actuator(const BodyPlan& plan, const ActuationConfig& config = ActuationConfig());

    /**
     * Apply one command. A body that is missing or throws drops only its own
     * motor for this call.
     *
     * @return Number of motors that produced a torque
     */
    int apply(const BodyRig& rig, const Eigen::VectorXf& command);

    // Torque a command value would produce on motor `index`
    Eigen::Vector3d torqueFor(int index, float value) const;

    double motorStrength() const { return strength_; }
    const std::vector<MotorSpec>& motors() const { return motors_; }
    uint64_t failures() const { return failures_; }

private:
    std::vector<MotorSpec> motors_;
    ActuationConfig config_;
    double strength_;
    uint64_t failures_ = 0;
};

} // namespace upright
