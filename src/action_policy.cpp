#include "upright/action_policy.hpp"
#include "upright/error.hpp"
#include "upright/log.hpp"
#include <algorithm>

namespace upright {

const char* to_string(PolicyMode mode) {
    return mode == PolicyMode::Exploit ? "exploit" : "explore";
}

ActionPolicy::ActionPolicy(int motorCount, const PolicyConfig& config)
    : config_(config),
      motorCount_(motorCount),
      explorationRate_(config.initialExploration),
      rng_(config.seed != 0 ? config.seed : std::random_device{}()) {

    if (config_.explorationFloor < 0.0 || config_.explorationFloor > config_.initialExploration ||
        config_.initialExploration > 1.0) {
        throw UprightError(ErrorCode::InvalidArgument,
            "Policy needs 0 <= explorationFloor <= initialExploration <= 1");
    }
    if (config_.explorationDecay <= 0.0 || config_.explorationDecay > 1.0) {
        throw UprightError(ErrorCode::InvalidArgument, "Exploration decay must be in (0, 1]");
    }
}

Eigen::VectorXf ActionPolicy::explore() {
    std::uniform_real_distribution<float> noise(
        -static_cast<float>(config_.noiseScale), static_cast<float>(config_.noiseScale));
    Eigen::VectorXf action(motorCount_);
    for (int i = 0; i < motorCount_; ++i) {
        action[i] = noise(rng_);
    }
    return action;
}

PolicyDecision ActionPolicy::decide(const Eigen::VectorXf& sensors, const ControllerNet& net) {
    PolicyDecision decision;

    const bool exploit = net != nullptr && unit_(rng_) >= explorationRate_;
    if (exploit) {
        try {
            decision.action = net->no_grad_forward(sensors);
            decision.mode = PolicyMode::Exploit;
        } catch (const std::exception& e) {
            LOG_WARN("[Policy] Inference failed, exploring instead: " << e.what());
            decision.action = explore();
        }
    } else {
        decision.action = explore();
    }

    decay();
    return decision;
}

void ActionPolicy::decay() {
    explorationRate_ = std::max(config_.explorationFloor, explorationRate_ * config_.explorationDecay);
    ++ticks_;
}

void ActionPolicy::reset() {
    explorationRate_ = config_.initialExploration;
    ticks_ = 0;
}

} // namespace upright
