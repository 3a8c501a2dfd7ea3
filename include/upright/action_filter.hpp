#pragma once

#include <Eigen/Dense>

namespace upright {

struct ActionFilterConfig {
    double maxChangeRate = 0.05;  // per motor, per control tick
    double smoothing = 0.7;       // weight of the rate-limited command; 1 - smoothing on lastAction
};

// Rate limiter followed by a fixed exponential blend against the previous
// command. Output never moves more than maxChangeRate away from lastAction.
class ActionFilter {
public:
    ActionFilter(int motorCount, const ActionFilterConfig& config = ActionFilterConfig());

    // Returns the command to actuate and stores it as lastAction
    const Eigen::VectorXf& apply(const Eigen::VectorXf& raw);

    const Eigen::VectorXf& lastAction() const { return lastAction_; }

    // Zero command
    void reset();

    const ActionFilterConfig& config() const { return config_; }

private:
    ActionFilterConfig config_;
    Eigen::VectorXf lastAction_;
};

} // namespace upright
