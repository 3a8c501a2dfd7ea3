#pragma once

#include "upright/body_plan.hpp"
#include "upright/physics.hpp"
#include <Eigen/Dense>
#include <optional>
#include <vector>

namespace upright {

// Fixed positions of the common block, shared by every morphology.
// The limb block (thigh heights, foot heights, foot contacts) follows it.
namespace sensor_index {
constexpr int HeadY = 0;
constexpr int TorsoY = 1;
constexpr int CenterOfMassY = 2;
constexpr int TorsoX = 3;
constexpr int HeadVel = 4;     // x, y, z
constexpr int TorsoVel = 7;    // x, y, z
constexpr int HeadAccY = 10;
constexpr int TorsoAcc = 11;   // x, y, z
constexpr int RotX = 14;
constexpr int RotY = 15;
constexpr int RotZ = 16;
constexpr int RotW = 17;
constexpr int AngVelX = 18;
constexpr int AngVelZ = 19;
constexpr int LeftKnee = 20;
constexpr int RightKnee = 21;
constexpr int CommonCount = 22;
} // namespace sensor_index

struct SensorConfig {
    double groundLevel = 0.0;        // world y of the floor surface
    double contactThreshold = 0.1;   // fade band above the floor
    double contactOn = 0.5;          // contact value counted as "foot down"
};

// Out-of-band ground contact summary (not part of the network input)
struct GroundContact {
    std::vector<float> limbs;   // per foot, leg order, in [0, 1]
    float left = 0.0f;          // main left foot
    float right = 0.0f;         // main right foot
    bool leftDown = false;
    bool rightDown = false;
    bool both = false;
    bool stable = false;

    int feetDown() const { return (leftDown ? 1 : 0) + (rightDown ? 1 : 0); }
};

struct SensorReading {
    Eigen::VectorXf values;   // length == morphology.sensorCount
    GroundContact contact;
};

// Pads with zeros or truncates so the result has exactly `width` entries
Eigen::VectorXf fitToWidth(const Eigen::VectorXf& values, int width);

// Continuous contact: 1 at or below the floor, fading to 0 over `threshold`
float contactValue(double footY, double groundLevel, double threshold);

class SensorEncoder {
public:
    explicit SensorEncoder(const BodyPlan& plan, const SensorConfig& config = SensorConfig());

    /**
     * Read the rig and build one sensor reading.
     *
     * @param rig Body handles of this robot instance
     * @param deltaTime Seconds since the previous control tick
     * @return std::nullopt while head or torso are not live; the caller skips the tick
     */
    std::optional<SensorReading> encode(const BodyRig& rig, double deltaTime);

    // Forget the velocity history, next reading has zero acceleration
    void reset();

    bool hasHistory() const { return hasPrevious_; }

    // Feature count before padding/truncation to sensorCount
    int rawFeatureCount() const;

    const SensorConfig& config() const { return config_; }

private:
    GroundContact summarizeContact(const std::vector<float>& limbs) const;

    const BodyPlan* plan_;
    SensorConfig config_;

    bool hasPrevious_ = false;
    Eigen::Vector3d prevHeadVel_ = Eigen::Vector3d::Zero();
    Eigen::Vector3d prevTorsoVel_ = Eigen::Vector3d::Zero();
};

} // namespace upright
