#include "upright/fitness.hpp"
#include <algorithm>
#include <cmath>

namespace upright {

float FitnessBreakdown::sum() const {
    return headHeight + torsoHeight + position + stillness + upright +
           groundContact + jointStability + angularStability;
}

FitnessEvaluator::FitnessEvaluator(const FitnessConfig& config)
    : config_(config) {}

FitnessBreakdown FitnessEvaluator::breakdown(const SensorReading& reading) const {
    using namespace sensor_index;
    const Eigen::VectorXf& v = reading.values;

    FitnessBreakdown b;
    if (v.size() < CommonCount) {
        return b;
    }
    b.headHeight = std::max(0.0f, static_cast<float>(40.0 * v[HeadY] / config_.targetHeadHeight));
    b.torsoHeight = std::max(0.0f, static_cast<float>(30.0 * v[TorsoY] / config_.targetTorsoHeight));
    b.position = std::max(0.0f, 15.0f * (1.0f - std::min(1.0f,
        static_cast<float>(std::abs(v[TorsoX]) / config_.positionRange))));

    const float speed = v.segment<3>(TorsoVel).norm();
    b.stillness = std::max(0.0f, 10.0f * (1.0f - std::min(1.0f,
        static_cast<float>(speed / config_.velocityRange))));

    b.upright = std::max(0.0f, 15.0f * (1.0f - std::abs(v[RotX]) - std::abs(v[RotZ])));
    b.groundContact = 10.0f * static_cast<float>(reading.contact.feetDown());
    b.jointStability = std::max(0.0f, 10.0f * (1.0f - (std::abs(v[LeftKnee]) + std::abs(v[RightKnee])) / 2.0f));
    b.angularStability = std::max(0.0f, 10.0f * (1.0f - (std::abs(v[AngVelX]) + std::abs(v[AngVelZ])) / 2.0f));
    return b;
}

float FitnessEvaluator::evaluate(const SensorReading& reading) const {
    if (reading.values.size() < sensor_index::CommonCount) {
        return kMax;
    }
    // Corrupt physics state earns nothing
    if (reading.values.hasNaN()) {
        return kMin;
    }
    float total = breakdown(reading).sum();
    return std::clamp(total, kMin, kMax);
}

} // namespace upright
