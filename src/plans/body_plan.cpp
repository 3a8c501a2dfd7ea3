#include "upright/body_plan.hpp"
#include "upright/error.hpp"

namespace upright {

std::vector<MotorSpec> BodyPlan::motors() const {
    const auto& names = legs();
    std::vector<MotorSpec> table;
    table.reserve(names.size() * 3);

    for (size_t i = 0; i + 1 < names.size(); i += 2) {
        const std::string& left = names[i];
        const std::string& right = names[i + 1];
        table.push_back({thigh(left),  JointKind::Hip,   axisScale(JointKind::Hip)});
        table.push_back({thigh(right), JointKind::Hip,   axisScale(JointKind::Hip)});
        table.push_back({shin(left),   JointKind::Knee,  axisScale(JointKind::Knee)});
        table.push_back({shin(right),  JointKind::Knee,  axisScale(JointKind::Knee)});
        table.push_back({foot(left),   JointKind::Ankle, axisScale(JointKind::Ankle)});
        table.push_back({foot(right),  JointKind::Ankle, axisScale(JointKind::Ankle)});
    }
    return table;
}

std::vector<std::string> BodyPlan::trackedParts() const {
    std::vector<std::string> parts = {head(), torso()};
    for (const auto& leg : legs()) {
        parts.push_back(thigh(leg));
        parts.push_back(shin(leg));
        parts.push_back(foot(leg));
    }
    return parts;
}

Eigen::Vector3d BodyPlan::axisScale(JointKind kind) const {
    switch (kind) {
        case JointKind::Hip:   return Eigen::Vector3d(0.4, 0.0, 0.2);
        case JointKind::Knee:  return Eigen::Vector3d(0.3, 0.0, 0.0);
        case JointKind::Ankle: return Eigen::Vector3d(0.2, 0.0, 0.1);
        case JointKind::Torso: return Eigen::Vector3d(0.1, 0.0, 0.1);
        case JointKind::Head:  return Eigen::Vector3d(0.05, 0.0, 0.05);
    }
    return Eigen::Vector3d::Zero();
}

PartGeometry BodyPlan::torsoPart(const Eigen::Vector3d& size, double mass) {
    PartGeometry part;
    part.name = torso();
    part.size = size;
    part.mass = mass;
    part.position = Eigen::Vector3d::Zero();
    part.jointPosition = Eigen::Vector3d::Zero();
    return part;
}

PartGeometry BodyPlan::headPart(double radius, double mass, const Eigen::Vector3d& pivot) {
    PartGeometry part;
    part.name = head();
    part.parent = torso();
    part.sphere = true;
    part.size = Eigen::Vector3d::Constant(radius);
    part.mass = mass;
    part.jointPosition = pivot;
    part.position = pivot + Eigen::Vector3d(0.0, radius, 0.0);
    return part;
}

void BodyPlan::appendLeg(std::vector<PartGeometry>& parts, const std::string& leg,
                         const Eigen::Vector3d& hip, const LegDims& dims) {
    PartGeometry upper;
    upper.name = thigh(leg);
    upper.parent = torso();
    upper.size = dims.thigh;
    upper.mass = dims.thighMass;
    upper.jointPosition = hip;
    upper.position = hip - Eigen::Vector3d(0.0, dims.thigh.y() * 0.5, 0.0);
    parts.push_back(upper);

    PartGeometry lower;
    lower.name = shin(leg);
    lower.parent = upper.name;
    lower.size = dims.shin;
    lower.mass = dims.shinMass;
    lower.jointPosition = hip - Eigen::Vector3d(0.0, dims.thigh.y(), 0.0);
    lower.position = lower.jointPosition - Eigen::Vector3d(0.0, dims.shin.y() * 0.5, 0.0);
    parts.push_back(lower);

    PartGeometry sole;
    sole.name = foot(leg);
    sole.parent = lower.name;
    sole.size = dims.foot;
    sole.mass = dims.footMass;
    sole.jointPosition = lower.jointPosition - Eigen::Vector3d(0.0, dims.shin.y(), 0.0);
    sole.position = sole.jointPosition + Eigen::Vector3d(0.0, -dims.foot.y() * 0.5, dims.footForward);
    parts.push_back(sole);
}

std::unique_ptr<BodyPlan> makeBodyPlan(MorphologyId id) {
    switch (id) {
        case MorphologyId::Biped:     return std::make_unique<BipedPlan>();
        case MorphologyId::Quadruped: return std::make_unique<QuadrupedPlan>();
        case MorphologyId::Spider:    return std::make_unique<SpiderPlan>();
    }
    throw UprightError(ErrorCode::InvalidArgument, "No body plan for morphology");
}

} // namespace upright
