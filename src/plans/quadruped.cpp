#include "upright/body_plan.hpp"

namespace upright {

QuadrupedPlan::QuadrupedPlan()
    : legs_{"front_left", "front_right", "back_left", "back_right"} {}

const Morphology& QuadrupedPlan::morphology() const {
    return upright::morphology(MorphologyId::Quadruped);
}

std::vector<PartGeometry> QuadrupedPlan::geometry() const {
    std::vector<PartGeometry> parts;
    parts.push_back(torsoPart(Eigen::Vector3d(0.4, 0.3, 0.8), 3.0));
    parts.push_back(headPart(0.15, 0.3, Eigen::Vector3d(0.0, 0.15, 0.3)));

    LegDims dims;
    dims.thigh = Eigen::Vector3d(0.08, 0.3, 0.08);
    dims.shin = Eigen::Vector3d(0.06, 0.3, 0.06);
    dims.foot = Eigen::Vector3d(0.1, 0.04, 0.16);
    dims.thighMass = 0.8;
    dims.shinMass = 0.5;
    dims.footMass = 0.2;
    dims.footForward = 0.0;

    appendLeg(parts, "front_left",  Eigen::Vector3d(-0.2, -0.15,  0.3), dims);
    appendLeg(parts, "front_right", Eigen::Vector3d( 0.2, -0.15,  0.3), dims);
    appendLeg(parts, "back_left",   Eigen::Vector3d(-0.2, -0.15, -0.3), dims);
    appendLeg(parts, "back_right",  Eigen::Vector3d( 0.2, -0.15, -0.3), dims);
    return parts;
}

} // namespace upright
