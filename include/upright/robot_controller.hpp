#pragma once

#include "upright/action_filter.hpp"
#include "upright/action_policy.hpp"
#include "upright/actuator.hpp"
#include "upright/body_plan.hpp"
#include "upright/config.hpp"
#include "upright/experience_buffer.hpp"
#include "upright/fitness.hpp"
#include "upright/model_manager.hpp"
#include "upright/scheduler.hpp"
#include "upright/sensor_encoder.hpp"
#include "upright/telemetry.hpp"
#include <deque>
#include <functional>
#include <memory>
#include <optional>

namespace upright {

/**
 * Online-learning stand-up controller for one robot instance.
 *
 * Owns the controller state (network, buffer, exploration, last action) and
 * runs one tick per physics frame:
 *   sense -> fitness -> policy -> rate limit/smooth -> actuate,
 * with per-episode sample collection and periodic retraining.
 *
 * Usage:
 *   RobotController controller(config);
 *   controller.setResetCallback([&] { rig.restorePose(); });
 *   while (running) { controller.step(rig.bodies(), dt); world->step(); }
 *
 * Changing morphology means constructing a new controller.
 */
class RobotController {
public:
    using ResetCallback = std::function<void()>;
    using TelemetryCallback = std::function<void(const TelemetrySnapshot&)>;
    using EpisodeCallback = std::function<void(const EpisodeSummary&)>;

    explicit RobotController(const Config& config = Config());
    ~RobotController();

    RobotController(const RobotController&) = delete;
    RobotController& operator=(const RobotController&) = delete;

    /**
     * Per-frame tick handler. Never throws for runtime conditions: missing
     * bodies skip the frame, actuation errors drop single joints, training
     * errors are reported through lastFitResult().
     */
    void step(const BodyRig& rig, double dt);

    // Fresh network, collected samples are kept
    void resetModel();

    // Forget kinematic history after the pose was restored
    void resetPositionState();

    // Everything back to construction defaults
    void resetAll();

    void setTrainingActive(bool active);
    bool trainingActive() const { return trainingActive_; }

    // Scales episode and training thresholds; must be positive
    void setSimulationSpeed(double speed);
    double simulationSpeed() const { return scheduler_.simulationSpeed(); }

    // Synchronous fit on the current buffer; Busy while a background fit runs
    FitResult trainNow();

    // Block until an in-flight fit finishes and its result is applied
    void waitForTraining();

    ExportResult exportModel(const std::string& directory) const;
    ImportResult loadModel(const std::string& path);

    // Boundary-exit signal: the owner restores the rest pose inside the callback
    void setResetCallback(ResetCallback callback) { onReset_ = std::move(callback); }
    void setTelemetryCallback(TelemetryCallback callback) { onTelemetry_ = std::move(callback); }
    void setEpisodeCallback(EpisodeCallback callback) { onEpisode_ = std::move(callback); }

    const TelemetryChannel& telemetry() const { return telemetry_; }

    const Morphology& morphology() const { return plan_->morphology(); }
    const BodyPlan& plan() const { return *plan_; }
    const Config& config() const { return config_; }

    bool isInitialized() const { return models_.isInitialized(); }
    bool isTraining() const { return models_.isTraining(); }
    double explorationRate() const { return policy_.explorationRate(); }
    uint64_t stepCount() const { return stepCount_; }
    float bestFitness() const { return buffer_.bestFitness(); }
    const Eigen::VectorXf& bestAction() const { return buffer_.bestAction(); }
    const std::deque<float>& fitnessHistory() const { return fitnessHistory_; }
    const Eigen::VectorXf& lastAction() const { return filter_.lastAction(); }
    const std::optional<FitResult>& lastFitResult() const { return lastFit_; }

    const ExperienceBuffer& buffer() const { return buffer_; }
    ExperienceBuffer& buffer() { return buffer_; }
    const TrainingScheduler& scheduler() const { return scheduler_; }
    ModelManager& models() { return models_; }
    const Actuator& actuator() const { return actuator_; }

private:
    void controlTick(const BodyRig& rig, double delta);
    void endEpisode(EpisodeEnd reason);
    void startTraining();
    void handleFitResult(const FitResult& result);

    Config config_;
    std::unique_ptr<BodyPlan> plan_;

    SensorEncoder encoder_;
    FitnessEvaluator fitness_;
    ActionPolicy policy_;
    ActionFilter filter_;
    ExperienceBuffer buffer_;
    TrainingScheduler scheduler_;
    Actuator actuator_;
    ModelManager models_;

    bool trainingActive_;
    uint64_t stepCount_ = 0;
    std::deque<float> fitnessHistory_;
    std::optional<FitResult> lastFit_;

    TelemetryChannel telemetry_;
    ResetCallback onReset_;
    TelemetryCallback onTelemetry_;
    EpisodeCallback onEpisode_;
};

} // namespace upright
