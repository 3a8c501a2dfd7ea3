#include "upright/body_plan.hpp"

namespace upright {

BipedPlan::BipedPlan()
    : legs_{"left", "right"} {}

const Morphology& BipedPlan::morphology() const {
    return upright::morphology(MorphologyId::Biped);
}

std::vector<MotorSpec> BipedPlan::motors() const {
    auto table = BodyPlan::motors();
    table.push_back({torso(), JointKind::Torso, axisScale(JointKind::Torso)});
    table.push_back({head(),  JointKind::Head,  axisScale(JointKind::Head)});
    return table;
}

std::vector<PartGeometry> BipedPlan::geometry() const {
    std::vector<PartGeometry> parts;
    parts.push_back(torsoPart(Eigen::Vector3d(0.35, 0.7, 0.18), 2.5));
    parts.push_back(headPart(0.18, 0.4, Eigen::Vector3d(0.0, 0.35, 0.0)));

    LegDims dims;
    dims.thigh = Eigen::Vector3d(0.11, 0.44, 0.11);
    dims.shin = Eigen::Vector3d(0.09, 0.36, 0.09);
    dims.foot = Eigen::Vector3d(0.13, 0.04, 0.22);
    dims.thighMass = 1.0;
    dims.shinMass = 0.7;
    dims.footMass = 0.3;
    dims.footForward = 0.03;

    appendLeg(parts, "left",  Eigen::Vector3d(-0.12, -0.35, 0.0), dims);
    appendLeg(parts, "right", Eigen::Vector3d( 0.12, -0.35, 0.0), dims);
    return parts;
}

} // namespace upright
