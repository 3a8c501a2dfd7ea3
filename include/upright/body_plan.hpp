#pragma once

#include "upright/morphology.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace upright {

enum class JointKind {
    Hip,
    Knee,
    Ankle,
    Torso,
    Head
};

// One actuated degree of control: command i drives a torque on `part`
// scaled per world axis.
struct MotorSpec {
    std::string part;
    JointKind kind;
    Eigen::Vector3d axisScale;
};

// Rest-pose geometry of one body part, expressed in the torso frame.
// Used by physics backends to build the robot.
struct PartGeometry {
    std::string name;
    std::string parent;             // empty for the root (torso)
    bool sphere = false;
    Eigen::Vector3d size;           // box extents, or (r, r, r) for spheres
    double mass = 1.0;
    Eigen::Vector3d position;       // part center
    Eigen::Vector3d jointPosition;  // ball-joint pivot to the parent
};

// Per-morphology body layout: which parts exist, how legs are ordered, and
// how the action vector maps onto torques.
class BodyPlan {
public:
    virtual ~BodyPlan() = default;

    virtual const Morphology& morphology() const = 0;

    // Leg names in sensor/motor order, e.g. {"left", "right"}
    virtual const std::vector<std::string>& legs() const = 0;

    // Default torque multiplier applied to every motor command
    virtual double defaultMotorStrength() const = 0;

    // Geometry for backends that build the robot themselves
    virtual std::vector<PartGeometry> geometry() const = 0;

    // The two legs used for knee angles and the two-foot contact bonus
    const std::string& mainLeft() const { return legs()[0]; }
    const std::string& mainRight() const { return legs()[1]; }

    // Motor table. Per leg pair: left hip, right hip, left knee, right knee,
    // left ankle, right ankle; pairs follow leg order. Size == motorCount.
    virtual std::vector<MotorSpec> motors() const;

    // head, torso, then thigh/shin/foot for every leg
    std::vector<std::string> trackedParts() const;

    static std::string head() { return "head"; }
    static std::string torso() { return "torso"; }
    static std::string thigh(const std::string& leg) { return leg + "_thigh"; }
    static std::string shin(const std::string& leg) { return leg + "_shin"; }
    static std::string foot(const std::string& leg) { return leg + "_foot"; }

protected:
    virtual Eigen::Vector3d axisScale(JointKind kind) const;

    struct LegDims {
        Eigen::Vector3d thigh, shin, foot;
        double thighMass, shinMass, footMass;
        double footForward;  // z offset of the foot under the shin
    };

    static PartGeometry torsoPart(const Eigen::Vector3d& size, double mass);
    static PartGeometry headPart(double radius, double mass, const Eigen::Vector3d& pivot);

    // Stacks thigh, shin and foot straight down from the hip pivot
    static void appendLeg(std::vector<PartGeometry>& parts, const std::string& leg,
                          const Eigen::Vector3d& hip, const LegDims& dims);
};

class BipedPlan : public BodyPlan {
public:
    BipedPlan();
    const Morphology& morphology() const override;
    const std::vector<std::string>& legs() const override { return legs_; }
    double defaultMotorStrength() const override { return 0.00625; }
    std::vector<PartGeometry> geometry() const override;

    // Leg motors plus torso and head stabilisers
    std::vector<MotorSpec> motors() const override;

private:
    std::vector<std::string> legs_;
};

class QuadrupedPlan : public BodyPlan {
public:
    QuadrupedPlan();
    const Morphology& morphology() const override;
    const std::vector<std::string>& legs() const override { return legs_; }
    double defaultMotorStrength() const override { return 0.004; }
    std::vector<PartGeometry> geometry() const override;

private:
    std::vector<std::string> legs_;
};

class SpiderPlan : public BodyPlan {
public:
    SpiderPlan();
    const Morphology& morphology() const override;
    const std::vector<std::string>& legs() const override { return legs_; }
    double defaultMotorStrength() const override { return 0.003; }
    std::vector<PartGeometry> geometry() const override;

protected:
    // Lighter torque profile for the thinner legs
    Eigen::Vector3d axisScale(JointKind kind) const override;

private:
    std::vector<std::string> legs_;
};

// Factory keyed by morphology tag
std::unique_ptr<BodyPlan> makeBodyPlan(MorphologyId id);

} // namespace upright
