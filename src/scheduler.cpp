#include "upright/scheduler.hpp"
#include "upright/error.hpp"
#include "upright/log.hpp"

namespace upright {

const char* to_string(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle:      return "idle";
        case SchedulerState::Settling:  return "settling";
        case SchedulerState::Running:   return "running";
        case SchedulerState::Resetting: return "resetting";
        default:                        return "unknown";
    }
}

const char* to_string(EpisodeEnd end) {
    return end == EpisodeEnd::Boundary ? "boundary" : "timeout";
}

TrainingScheduler::TrainingScheduler(const SchedulerConfig& config)
    : config_(config) {
    if (config_.controlInterval <= 0.0 || config_.episodeDuration <= 0.0 ||
        config_.trainingInterval <= 0.0 || config_.settleDuration < 0.0) {
        throw UprightError(ErrorCode::InvalidArgument, "Scheduler intervals must be positive");
    }
}

void TrainingScheduler::start() {
    if (state_ != SchedulerState::Idle) return;
    settleTimer_ = 0.0;
    state_ = config_.settleDuration > 0.0 ? SchedulerState::Settling : SchedulerState::Running;
    LOG_VERBOSE("[Scheduler] Started (" << to_string(state_) << ")");
}

void TrainingScheduler::setSimulationSpeed(double speed) {
    if (!(speed > 0.0)) {
        throw UprightError(ErrorCode::InvalidArgument, "Simulation speed must be positive");
    }
    speed_ = speed;
}

TickEvents TrainingScheduler::advance(double dt, const Eigen::Vector3d& torso, bool trainingActive,
                                      bool trainingInFlight, size_t bufferSize) {
    TickEvents events;

    if (state_ == SchedulerState::Idle) {
        events.skipped = true;
        return events;
    }

    if (state_ == SchedulerState::Settling) {
        settleTimer_ += dt;
        if (settleTimer_ < config_.settleDuration / speed_) {
            events.skipped = true;
            return events;
        }
        state_ = SchedulerState::Running;
    }

    // A pose reset is pending; nothing runs until resume()
    if (state_ == SchedulerState::Resetting) {
        events.skipped = true;
        return events;
    }

    if (!config_.bounds.contains(torso)) {
        events.episodeEnd = EpisodeEnd::Boundary;
        return events;
    }

    controlTimer_ += dt;
    trainingTimer_ += dt;
    episode_.elapsed += dt;

    if (episode_.elapsed >= episodeTimeout()) {
        events.episodeEnd = EpisodeEnd::Timeout;
        return events;
    }

    if (trainingTimer_ >= trainingTimeout() && !trainingInFlight && trainingActive &&
        bufferSize >= config_.minSamples) {
        events.trainingDue = true;
        trainingTimer_ = 0.0;
    }

    if (controlTimer_ >= config_.controlInterval) {
        events.controlTick = true;
        events.controlDelta = controlTimer_;
        controlTimer_ = 0.0;
    }
    return events;
}

void TrainingScheduler::recordObservation(const Eigen::VectorXf& state, float fitness, bool trainingActive) {
    if (!episode_.startState && trainingActive) {
        episode_.startState = state;
        episode_.actions.clear();
    }
    episode_.fitnessSum += fitness;
    ++episode_.ticks;
}

void TrainingScheduler::recordAction(const Eigen::VectorXf& action, bool trainingActive) {
    if (trainingActive) {
        episode_.actions.push_back(action);
    }
}

EpisodeSummary TrainingScheduler::finishEpisode(EpisodeEnd reason, bool trainingActive) {
    EpisodeSummary summary;
    summary.index = ++episodeCount_;
    summary.reason = reason;
    summary.averageFitness = static_cast<float>(episode_.averageFitness());
    summary.ticks = episode_.ticks;
    summary.actionsTaken = episode_.actions.size();

    if (trainingActive && episode_.startState && !episode_.actions.empty()) {
        ExperienceSample sample;
        sample.state = *episode_.startState;
        sample.action = episode_.actions.back();
        sample.fitness = summary.averageFitness;
        summary.sample = std::move(sample);
    }

    LOG_INFO("[Scheduler] Episode " << summary.index << " complete (" << to_string(reason)
             << ") - Avg fitness: " << summary.averageFitness
             << ", actions: " << summary.actionsTaken);

    episode_ = Episode();
    controlTimer_ = 0.0;
    state_ = SchedulerState::Resetting;
    return summary;
}

void TrainingScheduler::resume() {
    if (state_ == SchedulerState::Resetting) {
        state_ = SchedulerState::Running;
    }
}

void TrainingScheduler::reset() {
    state_ = SchedulerState::Idle;
    settleTimer_ = 0.0;
    controlTimer_ = 0.0;
    trainingTimer_ = 0.0;
    episode_ = Episode();
    episodeCount_ = 0;
}

} // namespace upright
