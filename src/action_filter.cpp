#include "upright/action_filter.hpp"
#include "upright/error.hpp"
#include <algorithm>
#include <cmath>

namespace upright {

ActionFilter::ActionFilter(int motorCount, const ActionFilterConfig& config)
    : config_(config), lastAction_(Eigen::VectorXf::Zero(motorCount)) {
    if (config_.maxChangeRate < 0.0 || config_.smoothing < 0.0 || config_.smoothing > 1.0) {
        throw UprightError(ErrorCode::InvalidArgument,
            "Action filter needs maxChangeRate >= 0 and smoothing in [0, 1]");
    }
}

const Eigen::VectorXf& ActionFilter::apply(const Eigen::VectorXf& raw) {
    const float rate = static_cast<float>(config_.maxChangeRate);
    const float alpha = static_cast<float>(config_.smoothing);

    for (Eigen::Index i = 0; i < lastAction_.size(); ++i) {
        const float last = lastAction_[i];
        // Missing or non-finite components hold the previous command
        float delta = 0.0f;
        if (i < raw.size() && std::isfinite(raw[i])) {
            delta = std::clamp(raw[i] - last, -rate, rate);
        }
        const float limited = last + delta;
        float out = alpha * limited + (1.0f - alpha) * last;
        lastAction_[i] = std::clamp(out, -1.0f, 1.0f);
    }
    return lastAction_;
}

void ActionFilter::reset() {
    lastAction_.setZero();
}

} // namespace upright
