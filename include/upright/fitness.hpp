#pragma once

#include "upright/sensor_encoder.hpp"

namespace upright {

struct FitnessConfig {
    double targetHeadHeight = 1.8;
    double targetTorsoHeight = 1.0;
    double positionRange = 2.0;   // |torsoX| at which positional credit reaches 0
    double velocityRange = 2.0;   // |torsoVel| at which stillness credit reaches 0
};

// Individual additive terms, before clamping
struct FitnessBreakdown {
    float headHeight = 0.0f;        // up to 40 at target, unbounded above
    float torsoHeight = 0.0f;       // up to 30 at target, unbounded above
    float position = 0.0f;          // 0..15
    float stillness = 0.0f;         // 0..10
    float upright = 0.0f;           // 0..15
    float groundContact = 0.0f;     // 0, 10 or 20
    float jointStability = 0.0f;    // 0..10
    float angularStability = 0.0f;  // 0..10

    float sum() const;
};

// Scores how upright and still the robot is, additively, in [0, 100].
// Readings shorter than the common sensor block score 100.
class FitnessEvaluator {
public:
    static constexpr float kMin = 0.0f;
    static constexpr float kMax = 100.0f;

    explicit FitnessEvaluator(const FitnessConfig& config = FitnessConfig());

    float evaluate(const SensorReading& reading) const;
    float operator()(const SensorReading& reading) const { return evaluate(reading); }

    // All terms zero for readings shorter than the common sensor block
    FitnessBreakdown breakdown(const SensorReading& reading) const;

    const FitnessConfig& config() const { return config_; }

private:
    FitnessConfig config_;
};

} // namespace upright
