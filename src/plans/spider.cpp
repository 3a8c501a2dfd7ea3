#include "upright/body_plan.hpp"

namespace upright {

SpiderPlan::SpiderPlan()
    : legs_{"front_left", "front_right", "mid_left", "mid_right", "back_left", "back_right"} {}

const Morphology& SpiderPlan::morphology() const {
    return upright::morphology(MorphologyId::Spider);
}

Eigen::Vector3d SpiderPlan::axisScale(JointKind kind) const {
    switch (kind) {
        case JointKind::Hip:   return Eigen::Vector3d(0.3, 0.0, 0.15);
        case JointKind::Knee:  return Eigen::Vector3d(0.25, 0.0, 0.0);
        case JointKind::Ankle: return Eigen::Vector3d(0.15, 0.0, 0.08);
        default:               return BodyPlan::axisScale(kind);
    }
}

std::vector<PartGeometry> SpiderPlan::geometry() const {
    std::vector<PartGeometry> parts;
    parts.push_back(torsoPart(Eigen::Vector3d(0.6, 0.25, 0.7), 2.5));
    parts.push_back(headPart(0.12, 0.25, Eigen::Vector3d(0.0, 0.125, 0.35)));

    LegDims dims;
    dims.thigh = Eigen::Vector3d(0.06, 0.25, 0.06);
    dims.shin = Eigen::Vector3d(0.05, 0.24, 0.05);
    dims.foot = Eigen::Vector3d(0.08, 0.03, 0.12);
    dims.thighMass = 0.6;
    dims.shinMass = 0.4;
    dims.footMass = 0.15;
    dims.footForward = -0.02;

    appendLeg(parts, "front_left",  Eigen::Vector3d(-0.25, -0.125,  0.25), dims);
    appendLeg(parts, "front_right", Eigen::Vector3d( 0.25, -0.125,  0.25), dims);
    appendLeg(parts, "mid_left",    Eigen::Vector3d(-0.3,  -0.125,  0.0),  dims);
    appendLeg(parts, "mid_right",   Eigen::Vector3d( 0.3,  -0.125,  0.0),  dims);
    appendLeg(parts, "back_left",   Eigen::Vector3d(-0.25, -0.125, -0.25), dims);
    appendLeg(parts, "back_right",  Eigen::Vector3d( 0.25, -0.125, -0.25), dims);
    return parts;
}

} // namespace upright
