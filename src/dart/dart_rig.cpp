#include "upright/dart_rig.hpp"
#include "upright/error.hpp"
#include "upright/log.hpp"
#include <algorithm>
#include <limits>
#include <unordered_map>

using namespace dart::dynamics;

namespace upright {

namespace {

ShapePtr makeShape(const PartGeometry& part) {
    if (part.sphere) {
        return std::make_shared<SphereShape>(part.size.x());
    }
    return std::make_shared<BoxShape>(part.size);
}

Inertia makeInertia(const ShapePtr& shape, double mass) {
    Inertia inertia;
    inertia.setMass(mass);
    inertia.setMoment(shape->computeInertia(mass));
    return inertia;
}

Eigen::Isometry3d translation(const Eigen::Vector3d& t) {
    Eigen::Isometry3d T = Eigen::Isometry3d::Identity();
    T.translation() = t;
    return T;
}

FreeJoint::Properties makeFreeJointProperties(const std::string& name, const Eigen::Isometry3d& parent_to_joint) {
    FreeJoint::Properties props;
    props.mName = name;
    props.mT_ParentBodyToJoint = parent_to_joint;
    props.mT_ChildBodyToJoint = Eigen::Isometry3d::Identity();
    props.mIsPositionLimitEnforced = false;
    props.mVelocityLowerLimits = Eigen::Vector6d::Constant(-100.0);
    props.mVelocityUpperLimits = Eigen::Vector6d::Constant(100.0);
    return props;
}

BallJoint::Properties makeBallJointProperties(const std::string& name,
                                              const Eigen::Isometry3d& parent_to_joint,
                                              const Eigen::Isometry3d& child_to_joint,
                                              double damping) {
    BallJoint::Properties props;
    props.mName = name;
    props.mT_ParentBodyToJoint = parent_to_joint;
    props.mT_ChildBodyToJoint = child_to_joint;
    props.mIsPositionLimitEnforced = false;
    props.mVelocityLowerLimits = Eigen::Vector3d::Constant(-100.0);
    props.mVelocityUpperLimits = Eigen::Vector3d::Constant(100.0);
    props.mDampingCoefficients = Eigen::Vector3d::Constant(damping);
    return props;
}

} // namespace

// ---------------------------------------------------------------------------
// DartBody
// ---------------------------------------------------------------------------

Eigen::Vector3d DartBody::translation() const {
    return node_->getWorldTransform().translation();
}

Eigen::Vector3d DartBody::linvel() const {
    return node_->getCOMLinearVelocity();
}

Eigen::Vector3d DartBody::angvel() const {
    return node_->getAngularVelocity();
}

Eigen::Quaterniond DartBody::rotation() const {
    return Eigen::Quaterniond(node_->getWorldTransform().linear()).normalized();
}

void DartBody::addTorque(const Eigen::Vector3d& torque, bool /*wake*/) {
    if (node_ == nullptr) {
        throw UprightError(ErrorCode::PhysicsError, "Torque on a released body");
    }
    node_->addExtTorque(torque, false);
}

void DartBody::addForce(const Eigen::Vector3d& force, bool /*wake*/) {
    if (node_ == nullptr) {
        throw UprightError(ErrorCode::PhysicsError, "Force on a released body");
    }
    node_->addExtForce(force, Eigen::Vector3d::Zero(), false, true);
}

// ---------------------------------------------------------------------------
// DartRig
// ---------------------------------------------------------------------------

DartRig::DartRig(const BodyPlan& plan, const DartConfig& config, double groundLevel)
    : config_(config) {

    // Lift the torso so the lowest sole sits `spawnClearance` above the floor
    double lowest = std::numeric_limits<double>::max();
    for (const auto& part : plan.geometry()) {
        lowest = std::min(lowest, part.position.y() - part.size.y() * 0.5);
    }
    spawnHeight_ = groundLevel - lowest + config_.spawnClearance;

    world_ = dart::simulation::World::create("upright");
    world_->setTimeStep(config_.timeStep);
    world_->setGravity(Eigen::Vector3d(0.0, config_.gravity, 0.0));

    robot_ = buildRobot(plan);
    ground_ = buildGround(groundLevel);
    world_->addSkeleton(robot_);
    world_->addSkeleton(ground_);

    for (const auto& name : plan.trackedParts()) {
        BodyNode* node = robot_->getBodyNode(name);
        if (node == nullptr) {
            throw UprightError(ErrorCode::PhysicsError, name, "Body plan part missing from skeleton");
        }
        handles_.push_back(std::make_unique<DartBody>(node));
        rig_.attach(name, handles_.back().get());
    }

    LOG_INFO("[DartRig] " << plan.morphology().displayName << ": " << robot_->getNumBodyNodes()
             << " bodies, " << robot_->getNumDofs() << " dofs, spawn height " << spawnHeight_);
}

DartRig::~DartRig() {
    for (auto& handle : handles_) {
        handle->release();
    }
}

SkeletonPtr DartRig::buildRobot(const BodyPlan& plan) {
    SkeletonPtr skel = Skeleton::create(plan.morphology().key);
    std::unordered_map<std::string, PartGeometry> placed;

    for (const auto& part : plan.geometry()) {
        ShapePtr shape = makeShape(part);
        BodyNode* bn = nullptr;

        if (part.parent.empty()) {
            auto props = makeFreeJointProperties(part.name,
                translation(Eigen::Vector3d(0.0, spawnHeight_, 0.0) + part.position));
            bn = skel->createJointAndBodyNodePair<FreeJoint>(
                nullptr, props, BodyNode::AspectProperties(part.name)).second;
        } else {
            auto parentIt = placed.find(part.parent);
            BodyNode* parentNode = skel->getBodyNode(part.parent);
            if (parentIt == placed.end() || parentNode == nullptr) {
                throw UprightError(ErrorCode::PhysicsError, part.name, "Parent '" + part.parent + "' not built yet");
            }
            const PartGeometry& parent = parentIt->second;
            auto props = makeBallJointProperties(part.name,
                translation(part.jointPosition - parent.position),
                translation(part.jointPosition - part.position),
                config_.jointDamping);
            bn = skel->createJointAndBodyNodePair<BallJoint>(
                parentNode, props, BodyNode::AspectProperties(part.name)).second;
        }

        bn->setInertia(makeInertia(shape, part.mass));
        bn->createShapeNodeWith<VisualAspect, CollisionAspect, DynamicsAspect>(shape);
        placed[part.name] = part;
    }

    skel->setSelfCollisionCheck(config_.selfCollision);
    skel->setAdjacentBodyCheck(false);
    return skel;
}

SkeletonPtr DartRig::buildGround(double groundLevel) {
    SkeletonPtr ground = Skeleton::create("ground");

    WeldJoint::Properties props;
    props.mName = "ground";
    props.mT_ParentBodyToJoint = translation(Eigen::Vector3d(0.0, groundLevel - config_.groundThickness * 0.5, 0.0));

    BodyNode* bn = ground->createJointAndBodyNodePair<WeldJoint>(
        nullptr, props, BodyNode::AspectProperties("ground")).second;
    auto shape = std::make_shared<BoxShape>(Eigen::Vector3d(50.0, config_.groundThickness, 50.0));
    bn->createShapeNodeWith<VisualAspect, CollisionAspect, DynamicsAspect>(shape);
    return ground;
}

void DartRig::step() {
    world_->step();
}

void DartRig::restorePose() {
    robot_->setPositions(Eigen::VectorXd::Zero(robot_->getNumDofs()));
    robot_->setVelocities(Eigen::VectorXd::Zero(robot_->getNumDofs()));
    robot_->clearExternalForces();
    robot_->computeForwardKinematics();
}

double DartRig::time() const {
    return world_->getTime();
}

} // namespace upright
