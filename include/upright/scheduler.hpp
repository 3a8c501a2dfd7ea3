#pragma once

#include "upright/experience_buffer.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <optional>
#include <vector>

namespace upright {

// Region the torso must stay in; leaving it ends the episode
struct Bounds {
    double maxAbsX = 15.0;
    double minY = -5.0;
    double maxAbsZ = 15.0;

    bool contains(const Eigen::Vector3d& p) const {
        return std::abs(p.x()) <= maxAbsX && p.y() >= minY && std::abs(p.z()) <= maxAbsZ;
    }
};

struct SchedulerConfig {
    double controlInterval = 0.05;    // seconds between control ticks (20 Hz)
    double episodeDuration = 3.0;     // seconds at 1x speed
    double trainingInterval = 10.0;   // seconds at 1x speed
    size_t minSamples = 3;            // buffer size needed before a training trigger
    double settleDuration = 0.0;      // seconds before the first episode starts
    Bounds bounds;
};

enum class SchedulerState {
    Idle,
    Settling,
    Running,
    Resetting
};

enum class EpisodeEnd {
    Timeout,
    Boundary
};

const char* to_string(SchedulerState state);
const char* to_string(EpisodeEnd end);

// Episode-local accumulators
struct Episode {
    double elapsed = 0.0;
    double fitnessSum = 0.0;
    int ticks = 0;
    std::optional<Eigen::VectorXf> startState;
    std::vector<Eigen::VectorXf> actions;

    double averageFitness() const { return ticks > 0 ? fitnessSum / ticks : 0.0; }
};

struct EpisodeSummary {
    int index = 0;
    EpisodeEnd reason = EpisodeEnd::Timeout;
    float averageFitness = 0.0f;
    int ticks = 0;
    size_t actionsTaken = 0;
    std::optional<ExperienceSample> sample;   // set when the episode yields one
};

// What the owner has to do this frame
struct TickEvents {
    bool skipped = false;                     // not started yet or still settling
    std::optional<EpisodeEnd> episodeEnd;     // finish the episode and reset the pose
    bool trainingDue = false;                 // start a fit now
    bool controlTick = false;                 // sense and act now
    double controlDelta = 0.0;                // seconds since the previous control tick
};

/**
 * Episodic timing state machine: Idle -> Settling -> Running -> Resetting -> Running.
 *
 * Episode and training thresholds are divided by the simulation speed, so the
 * number of episodes per training event is the same at every speed. The control
 * tick runs on unscaled frame time.
 */
class TrainingScheduler {
public:
    explicit TrainingScheduler(const SchedulerConfig& config = SchedulerConfig());

    // Idle -> Settling (or Running when settleDuration is 0)
    void start();

    /**
     * Advance timers by one frame.
     *
     * @param dt Frame time in seconds
     * @param torso Current torso position, checked against the bounds first
     * @param trainingActive Whether samples are being collected
     * @param trainingInFlight Whether a fit is outstanding
     * @param bufferSize Samples currently in the experience buffer
     */
    TickEvents advance(double dt, const Eigen::Vector3d& torso, bool trainingActive,
                       bool trainingInFlight, size_t bufferSize);

    // Accumulate one control tick; the first one while training is active marks the start state
    void recordObservation(const Eigen::VectorXf& state, float fitness, bool trainingActive);
    void recordAction(const Eigen::VectorXf& action, bool trainingActive);

    /**
     * Close the current episode and enter Resetting. A sample (start state,
     * final action, average fitness) is produced when training is active and
     * the episode has both a start state and at least one action.
     */
    EpisodeSummary finishEpisode(EpisodeEnd reason, bool trainingActive);

    // Resetting -> Running, called once the pose has been restored
    void resume();

    // Back to Idle with zeroed timers and counters
    void reset();

    void setSimulationSpeed(double speed);
    double simulationSpeed() const { return speed_; }

    double episodeTimeout() const { return config_.episodeDuration / speed_; }
    double trainingTimeout() const { return config_.trainingInterval / speed_; }

    SchedulerState state() const { return state_; }
    const Episode& episode() const { return episode_; }
    int episodeCount() const { return episodeCount_; }
    double trainingTimer() const { return trainingTimer_; }
    double controlTimer() const { return controlTimer_; }

    const SchedulerConfig& config() const { return config_; }

private:
    SchedulerConfig config_;
    SchedulerState state_ = SchedulerState::Idle;
    double speed_ = 1.0;

    double settleTimer_ = 0.0;
    double controlTimer_ = 0.0;
    double trainingTimer_ = 0.0;

    Episode episode_;
    int episodeCount_ = 0;
};

} // namespace upright
