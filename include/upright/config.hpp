#pragma once

#include "upright/action_filter.hpp"
#include "upright/action_policy.hpp"
#include "upright/actuator.hpp"
#include "upright/experience_buffer.hpp"
#include "upright/fitness.hpp"
#include "upright/model_manager.hpp"
#include "upright/scheduler.hpp"
#include "upright/sensor_encoder.hpp"
#include <string>

namespace upright {

struct ExportConfig {
    std::string directory = "exports";
    bool onExit = false;   // driver exports when the run ends
};

// Physics world used by the training driver
struct DartConfig {
    double timeStep = 1.0 / 480.0;
    double gravity = -9.81;
    double groundThickness = 0.2;
    double spawnClearance = 0.02;   // gap between feet and floor at spawn
    double jointDamping = 0.4;
    bool selfCollision = false;
};

struct RobotConfig {
    std::string morphology = "biped";
    bool trainingActive = true;
    double simulationSpeed = 1.0;
    size_t fitnessHistory = 100;     // episode averages kept for display
    size_t telemetrySensors = 28;    // leading sensor values published per tick
};

struct Config {
    RobotConfig robot;
    SensorConfig sensors;
    FitnessConfig fitness;
    PolicyConfig policy;
    ActionFilterConfig actionFilter;
    BufferConfig buffer;
    SchedulerConfig scheduler;
    TrainingConfig training;
    ActuationConfig actuation;
    ExportConfig exports;
    DartConfig dart;
};

// Throws UprightError(ConfigError) on unreadable files, bad YAML or invalid values
Config loadConfig(const std::string& path);
Config parseConfig(const std::string& yaml);

// Range checks shared by both loaders
void validateConfig(const Config& config);

} // namespace upright
