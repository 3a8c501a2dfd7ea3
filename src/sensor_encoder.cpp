#include "upright/sensor_encoder.hpp"
#include <algorithm>
#include <cmath>

namespace upright {

Eigen::VectorXf fitToWidth(const Eigen::VectorXf& values, int width) {
    Eigen::VectorXf out = Eigen::VectorXf::Zero(width);
    const int n = std::min<int>(width, static_cast<int>(values.size()));
    out.head(n) = values.head(n);
    return out;
}

float contactValue(double footY, double groundLevel, double threshold) {
    if (threshold <= 0.0) {
        return footY <= groundLevel ? 1.0f : 0.0f;
    }
    double v = (groundLevel - footY + threshold) / threshold;
    return static_cast<float>(std::clamp(v, 0.0, 1.0));
}

SensorEncoder::SensorEncoder(const BodyPlan& plan, const SensorConfig& config)
    : plan_(&plan), config_(config) {}

void SensorEncoder::reset() {
    hasPrevious_ = false;
    prevHeadVel_.setZero();
    prevTorsoVel_.setZero();
}

int SensorEncoder::rawFeatureCount() const {
    return sensor_index::CommonCount + 3 * static_cast<int>(plan_->legs().size());
}

std::optional<SensorReading> SensorEncoder::encode(const BodyRig& rig, double deltaTime) {
    using namespace sensor_index;

    BodyHandle* head = rig.live(BodyPlan::head());
    BodyHandle* torso = rig.live(BodyPlan::torso());
    if (head == nullptr || torso == nullptr) {
        return std::nullopt;
    }

    // Optional parts read as the origin when missing
    auto position = [&rig](const std::string& part) -> Eigen::Vector3d {
        BodyHandle* body = rig.live(part);
        return body != nullptr ? body->translation() : Eigen::Vector3d::Zero();
    };

    const Eigen::Vector3d headPos = head->translation();
    const Eigen::Vector3d torsoPos = torso->translation();
    const Eigen::Vector3d headVel = head->linvel();
    const Eigen::Vector3d torsoVel = torso->linvel();
    const Eigen::Vector3d torsoAngVel = torso->angvel();
    const Eigen::Quaterniond torsoRot = torso->rotation();

    Eigen::Vector3d headAcc = Eigen::Vector3d::Zero();
    Eigen::Vector3d torsoAcc = Eigen::Vector3d::Zero();
    if (hasPrevious_ && deltaTime > 0.0) {
        headAcc = (headVel - prevHeadVel_) / deltaTime;
        torsoAcc = (torsoVel - prevTorsoVel_) / deltaTime;
    }

    const auto& legs = plan_->legs();
    const Eigen::Vector3d leftThigh = position(BodyPlan::thigh(plan_->mainLeft()));
    const Eigen::Vector3d rightThigh = position(BodyPlan::thigh(plan_->mainRight()));
    const Eigen::Vector3d leftShin = position(BodyPlan::shin(plan_->mainLeft()));
    const Eigen::Vector3d rightShin = position(BodyPlan::shin(plan_->mainRight()));

    const double comY = (headPos.y() + torsoPos.y() + leftThigh.y() + rightThigh.y()) / 4.0;
    const double leftKnee = std::atan2(leftThigh.y() - leftShin.y(), std::abs(leftThigh.x() - leftShin.x()));
    const double rightKnee = std::atan2(rightThigh.y() - rightShin.y(), std::abs(rightThigh.x() - rightShin.x()));

    Eigen::VectorXf raw = Eigen::VectorXf::Zero(rawFeatureCount());
    raw[HeadY] = static_cast<float>(headPos.y());
    raw[TorsoY] = static_cast<float>(torsoPos.y());
    raw[CenterOfMassY] = static_cast<float>(comY);
    raw[TorsoX] = static_cast<float>(torsoPos.x());
    raw.segment<3>(HeadVel) = headVel.cast<float>();
    raw.segment<3>(TorsoVel) = torsoVel.cast<float>();
    raw[HeadAccY] = static_cast<float>(headAcc.y());
    raw.segment<3>(TorsoAcc) = torsoAcc.cast<float>();
    raw[RotX] = static_cast<float>(torsoRot.x());
    raw[RotY] = static_cast<float>(torsoRot.y());
    raw[RotZ] = static_cast<float>(torsoRot.z());
    raw[RotW] = static_cast<float>(torsoRot.w());
    raw[AngVelX] = static_cast<float>(torsoAngVel.x());
    raw[AngVelZ] = static_cast<float>(torsoAngVel.z());
    raw[LeftKnee] = static_cast<float>(leftKnee);
    raw[RightKnee] = static_cast<float>(rightKnee);

    // Limb block: thigh heights, foot heights, foot contacts
    const int n = static_cast<int>(legs.size());
    std::vector<float> limbs(n, 0.0f);
    for (int i = 0; i < n; ++i) {
        raw[CommonCount + i] = static_cast<float>(position(BodyPlan::thigh(legs[i])).y());

        BodyHandle* foot = rig.live(BodyPlan::foot(legs[i]));
        if (foot != nullptr) {
            const double footY = foot->translation().y();
            raw[CommonCount + n + i] = static_cast<float>(footY);
            limbs[i] = contactValue(footY, config_.groundLevel, config_.contactThreshold);
        }
        raw[CommonCount + 2 * n + i] = limbs[i];
    }

    prevHeadVel_ = headVel;
    prevTorsoVel_ = torsoVel;
    hasPrevious_ = true;

    SensorReading reading;
    reading.values = fitToWidth(raw, plan_->morphology().sensorCount);
    reading.contact = summarizeContact(limbs);
    return reading;
}

GroundContact SensorEncoder::summarizeContact(const std::vector<float>& limbs) const {
    GroundContact contact;
    contact.limbs = limbs;
    if (limbs.size() >= 2) {
        contact.left = limbs[0];
        contact.right = limbs[1];
    }
    contact.leftDown = contact.left >= config_.contactOn;
    contact.rightDown = contact.right >= config_.contactOn;
    contact.both = contact.leftDown && contact.rightDown;
    contact.stable = contact.both;
    return contact;
}

} // namespace upright
