#pragma once

#include "upright/body_plan.hpp"
#include "upright/config.hpp"
#include "upright/physics.hpp"
#include <dart/dart.hpp>
#include <memory>
#include <string>
#include <vector>

namespace upright {

// BodyHandle over a DART BodyNode. All quantities in the world frame.
class DartBody : public BodyHandle {
public:
    explicit DartBody(dart::dynamics::BodyNode* node) : node_(node) {}

    bool isLive() const override { return node_ != nullptr; }

    Eigen::Vector3d translation() const override;
    Eigen::Vector3d linvel() const override;
    Eigen::Vector3d angvel() const override;
    Eigen::Quaterniond rotation() const override;

    // DART has no sleeping bodies; `wake` is accepted and ignored
    void addTorque(const Eigen::Vector3d& torque, bool wake = true) override;
    void addForce(const Eigen::Vector3d& force, bool wake = true) override;

    // Mark the node as gone (skeleton removed from the world)
    void release() { node_ = nullptr; }

    dart::dynamics::BodyNode* node() const { return node_; }

private:
    dart::dynamics::BodyNode* node_;
};

/**
 * DART world with a floor and one robot built from a body plan.
 *
 * The torso hangs off a free joint placed so that the feet start just above
 * the floor; every other part is attached with a damped ball joint. All joint
 * positions at zero is the rest pose.
 */
class DartRig {
public:
    DartRig(const BodyPlan& plan, const DartConfig& config, double groundLevel);
    ~DartRig();

    DartRig(const DartRig&) = delete;
    DartRig& operator=(const DartRig&) = delete;

    const BodyRig& bodies() const { return rig_; }

    void step();

    // Rest pose, zero velocity, no pending external forces
    void restorePose();

    double time() const;
    double spawnHeight() const { return spawnHeight_; }

    const dart::simulation::WorldPtr& world() const { return world_; }
    const dart::dynamics::SkeletonPtr& skeleton() const { return robot_; }

private:
    dart::dynamics::SkeletonPtr buildRobot(const BodyPlan& plan);
    dart::dynamics::SkeletonPtr buildGround(double groundLevel);

    DartConfig config_;
    double spawnHeight_ = 0.0;

    dart::simulation::WorldPtr world_;
    dart::dynamics::SkeletonPtr robot_;
    dart::dynamics::SkeletonPtr ground_;

    std::vector<std::unique_ptr<DartBody>> handles_;
    BodyRig rig_;
};

} // namespace upright
