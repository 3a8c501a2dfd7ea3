#pragma once

#include "upright/controller_net.hpp"
#include <Eigen/Dense>
#include <cstdint>
#include <random>

namespace upright {

struct PolicyConfig {
    double initialExploration = 1.0;
    double explorationDecay = 0.999;   // multiplicative, per control tick
    double explorationFloor = 0.1;
    double noiseScale = 1.0;           // explore draws from [-noiseScale, noiseScale]
    uint32_t seed = 0;                 // 0 = seed from std::random_device
};

enum class PolicyMode {
    Explore,
    Exploit
};

const char* to_string(PolicyMode mode);

struct PolicyDecision {
    Eigen::VectorXf action;   // raw, before post-processing
    PolicyMode mode = PolicyMode::Explore;
};

// Epsilon-greedy selection between uniform noise and the controller network,
// with an exploration rate that decays toward a floor.
class ActionPolicy {
public:
    explicit ActionPolicy(int motorCount, const PolicyConfig& config = PolicyConfig());

    /**
     * Pick the raw action for this control tick and decay the exploration rate.
     *
     * @param sensors Sensor values, the network pads/truncates them
     * @param net Current network, may be null (always explores)
     */
    PolicyDecision decide(const Eigen::VectorXf& sensors, const ControllerNet& net);

    // Uniform noise action, no decay
    Eigen::VectorXf explore();

    double explorationRate() const { return explorationRate_; }
    uint64_t ticks() const { return ticks_; }

    // Back to the initial exploration rate
    void reset();

    const PolicyConfig& config() const { return config_; }

private:
    void decay();

    PolicyConfig config_;
    int motorCount_;
    double explorationRate_;
    uint64_t ticks_ = 0;

    std::mt19937 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

} // namespace upright
