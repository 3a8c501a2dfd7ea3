#include "upright/robot_controller.hpp"
#include "upright/error.hpp"
#include "upright/log.hpp"
#include <algorithm>

namespace upright {

namespace {

Config validated(const Config& config) {
    validateConfig(config);
    return config;
}

} // namespace

RobotController::RobotController(const Config& config)
    : config_(validated(config)),
      plan_(makeBodyPlan(upright::morphology(config_.robot.morphology).id)),
      encoder_(*plan_, config_.sensors),
      fitness_(config_.fitness),
      policy_(plan_->morphology().motorCount, config_.policy),
      filter_(plan_->morphology().motorCount, config_.actionFilter),
      buffer_(config_.buffer),
      scheduler_(config_.scheduler),
      actuator_(*plan_, config_.actuation),
      models_(plan_->morphology(), config_.training),
      trainingActive_(config_.robot.trainingActive) {

    scheduler_.setSimulationSpeed(config_.robot.simulationSpeed);

    LOG_INFO("[Controller] " << plan_->morphology().displayName << ": "
             << plan_->morphology().sensorCount << " sensors, "
             << plan_->morphology().motorCount << " motors, motor strength "
             << actuator_.motorStrength());
}

RobotController::~RobotController() = default;

void RobotController::step(const BodyRig& rig, double dt) {
    if (auto done = models_.poll()) {
        handleFitResult(*done);
    }

    if (scheduler_.state() == SchedulerState::Idle) {
        if (!models_.isInitialized()) {
            models_.create();
        }
        scheduler_.start();
    }

    // Core bodies not live yet: skip the whole frame
    BodyHandle* torso = rig.live(BodyPlan::torso());
    if (torso == nullptr || rig.live(BodyPlan::head()) == nullptr) {
        return;
    }

    TickEvents events = scheduler_.advance(dt, torso->translation(), trainingActive_,
                                           models_.isTraining(), buffer_.size());
    if (events.skipped) {
        return;
    }
    if (events.episodeEnd) {
        endEpisode(*events.episodeEnd);
        return;
    }
    if (events.trainingDue) {
        startTraining();
    }
    if (events.controlTick) {
        controlTick(rig, events.controlDelta);
    }

    // The last command keeps acting between control ticks
    actuator_.apply(rig, filter_.lastAction());
}

void RobotController::controlTick(const BodyRig& rig, double delta) {
    std::optional<SensorReading> reading = encoder_.encode(rig, delta);
    if (!reading) {
        return;
    }

    const float fitness = fitness_(*reading);
    scheduler_.recordObservation(reading->values, fitness, trainingActive_);

    PolicyMode mode = PolicyMode::Explore;
    if (models_.isInitialized()) {
        PolicyDecision decision = policy_.decide(reading->values, models_.network());
        mode = decision.mode;
        const Eigen::VectorXf& command = filter_.apply(decision.action);
        scheduler_.recordAction(command, trainingActive_);
        ++stepCount_;
    }

    TelemetrySnapshot snapshot;
    snapshot.tick = stepCount_;
    const size_t shown = std::min<size_t>(config_.robot.telemetrySensors, reading->values.size());
    snapshot.sensors.assign(reading->values.data(), reading->values.data() + shown);
    snapshot.contact = reading->contact;
    snapshot.fitness = fitness;
    snapshot.explorationRate = policy_.explorationRate();
    snapshot.mode = mode;

    if (onTelemetry_) {
        onTelemetry_(snapshot);
    }
    telemetry_.publish(std::move(snapshot));
}

void RobotController::endEpisode(EpisodeEnd reason) {
    EpisodeSummary summary = scheduler_.finishEpisode(reason, trainingActive_ && models_.isInitialized());

    if (summary.sample) {
        buffer_.add(*summary.sample);
        LOG_VERBOSE("[Controller] Training sample added for episode " << summary.index
                    << " - fitness " << summary.sample->fitness
                    << ", buffer " << buffer_.size());
    }

    fitnessHistory_.push_back(summary.averageFitness);
    while (fitnessHistory_.size() > config_.robot.fitnessHistory) {
        fitnessHistory_.pop_front();
    }

    if (onEpisode_) {
        onEpisode_(summary);
    }
    if (onReset_) {
        try {
            onReset_();
        } catch (const std::exception& e) {
            LOG_ERROR("[Controller] Pose reset failed: " << e.what());
        }
    }
    resetPositionState();
}

void RobotController::startTraining() {
    if (config_.training.async) {
        FitResult result = models_.startFit(buffer_.snapshot());
        if (result.status != FitStatus::Started) {
            handleFitResult(result);
        }
    } else {
        handleFitResult(models_.fit(buffer_.snapshot()));
    }
}

void RobotController::handleFitResult(const FitResult& result) {
    lastFit_ = result;
    LOG_VERBOSE("[Controller] Fit finished: " << to_string(result.status)
                << " (" << result.qualifyingSamples << " qualifying, "
                << result.trainingRows << " rows)");
}

void RobotController::resetModel() {
    models_.reset();
}

void RobotController::resetPositionState() {
    encoder_.reset();
    scheduler_.resume();
}

void RobotController::resetAll() {
    models_.dispose();
    buffer_.clear();
    policy_.reset();
    filter_.reset();
    encoder_.reset();
    scheduler_.reset();
    scheduler_.setSimulationSpeed(config_.robot.simulationSpeed);
    trainingActive_ = config_.robot.trainingActive;
    stepCount_ = 0;
    fitnessHistory_.clear();
    lastFit_.reset();
    telemetry_.clear();
    LOG_INFO("[Controller] Full reset");
}

void RobotController::setTrainingActive(bool active) {
    if (active != trainingActive_) {
        LOG_INFO("[Controller] Training " << (active ? "enabled" : "paused")
                 << " (" << buffer_.size() << " samples kept)");
    }
    trainingActive_ = active;
}

void RobotController::setSimulationSpeed(double speed) {
    scheduler_.setSimulationSpeed(speed);
}

FitResult RobotController::trainNow() {
    FitResult result = models_.fit(buffer_.snapshot());
    handleFitResult(result);
    return result;
}

void RobotController::waitForTraining() {
    if (auto done = models_.waitForFit()) {
        handleFitResult(*done);
    }
}

ExportResult RobotController::exportModel(const std::string& directory) const {
    return models_.exportModel(directory, buffer_.size());
}

ImportResult RobotController::loadModel(const std::string& path) {
    return models_.importModel(path);
}

} // namespace upright
