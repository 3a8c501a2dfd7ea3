#include "upright/config.hpp"
#include "upright/error.hpp"
#include "upright/log.hpp"
#include "upright/morphology.hpp"
#include <yaml-cpp/yaml.h>

namespace upright {

namespace {

template<typename T>
void read(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) target = node[key].as<T>();
}

void parseRobot(const YAML::Node& node, RobotConfig& cfg) {
    read(node, "morphology", cfg.morphology);
    read(node, "training_active", cfg.trainingActive);
    read(node, "simulation_speed", cfg.simulationSpeed);
    read(node, "fitness_history", cfg.fitnessHistory);
    read(node, "telemetry_sensors", cfg.telemetrySensors);
}

void parseSensors(const YAML::Node& node, SensorConfig& cfg) {
    read(node, "ground_level", cfg.groundLevel);
    read(node, "contact_threshold", cfg.contactThreshold);
    read(node, "contact_on", cfg.contactOn);
}

void parseFitness(const YAML::Node& node, FitnessConfig& cfg) {
    read(node, "target_head_height", cfg.targetHeadHeight);
    read(node, "target_torso_height", cfg.targetTorsoHeight);
    read(node, "position_range", cfg.positionRange);
    read(node, "velocity_range", cfg.velocityRange);
}

void parsePolicy(const YAML::Node& node, PolicyConfig& cfg) {
    read(node, "initial_exploration", cfg.initialExploration);
    read(node, "exploration_decay", cfg.explorationDecay);
    read(node, "exploration_floor", cfg.explorationFloor);
    read(node, "noise_scale", cfg.noiseScale);
    read(node, "seed", cfg.seed);
}

void parseScheduler(const YAML::Node& node, SchedulerConfig& cfg) {
    read(node, "control_interval", cfg.controlInterval);
    read(node, "episode_duration", cfg.episodeDuration);
    read(node, "training_interval", cfg.trainingInterval);
    read(node, "min_samples", cfg.minSamples);
    read(node, "settle_duration", cfg.settleDuration);
    if (node["bounds"]) {
        const YAML::Node& b = node["bounds"];
        read(b, "max_abs_x", cfg.bounds.maxAbsX);
        read(b, "min_y", cfg.bounds.minY);
        read(b, "max_abs_z", cfg.bounds.maxAbsZ);
    }
}

void parseTraining(const YAML::Node& node, TrainingConfig& cfg) {
    read(node, "fitness_threshold", cfg.fitnessThreshold);
    read(node, "top_n", cfg.topN);
    read(node, "min_samples", cfg.minSamples);
    read(node, "replication_unit", cfg.replicationUnit);
    read(node, "epochs", cfg.epochs);
    read(node, "batch_size", cfg.batchSize);
    read(node, "learning_rate", cfg.learningRate);
    read(node, "dropout", cfg.dropout);
    read(node, "async", cfg.async);
    read(node, "seed", cfg.seed);
}

void parseDart(const YAML::Node& node, DartConfig& cfg) {
    read(node, "time_step", cfg.timeStep);
    read(node, "gravity", cfg.gravity);
    read(node, "ground_thickness", cfg.groundThickness);
    read(node, "spawn_clearance", cfg.spawnClearance);
    read(node, "joint_damping", cfg.jointDamping);
    read(node, "self_collision", cfg.selfCollision);
}

Config fromNode(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw UprightError(ErrorCode::ConfigError, "Config root must be a mapping");
    }

    if (root["robot"]) parseRobot(root["robot"], config.robot);
    if (root["sensors"]) parseSensors(root["sensors"], config.sensors);
    if (root["fitness"]) parseFitness(root["fitness"], config.fitness);
    if (root["policy"]) parsePolicy(root["policy"], config.policy);

    if (root["action_filter"]) {
        read(root["action_filter"], "max_change_rate", config.actionFilter.maxChangeRate);
        read(root["action_filter"], "smoothing", config.actionFilter.smoothing);
    }
    if (root["buffer"]) {
        read(root["buffer"], "capacity", config.buffer.capacity);
        read(root["buffer"], "retain", config.buffer.retain);
    }

    if (root["scheduler"]) parseScheduler(root["scheduler"], config.scheduler);
    if (root["training"]) parseTraining(root["training"], config.training);

    if (root["actuation"]) {
        read(root["actuation"], "motor_strength", config.actuation.motorStrength);
        read(root["actuation"], "deadband", config.actuation.deadband);
    }
    if (root["export"]) {
        read(root["export"], "directory", config.exports.directory);
        read(root["export"], "on_exit", config.exports.onExit);
    }

    if (root["dart"]) parseDart(root["dart"], config.dart);
    return config;
}

} // namespace

void validateConfig(const Config& config) {
    auto fail = [](const std::string& key, const std::string& message) {
        throw UprightError(ErrorCode::ConfigError, key, message);
    };

    if (!findMorphology(config.robot.morphology)) {
        fail("robot.morphology", "Unknown morphology '" + config.robot.morphology + "'");
    }
    if (!(config.robot.simulationSpeed > 0.0)) fail("robot.simulation_speed", "Must be positive");
    if (config.robot.fitnessHistory == 0) fail("robot.fitness_history", "Must be positive");

    if (config.sensors.contactThreshold < 0.0) fail("sensors.contact_threshold", "Must not be negative");

    if (config.fitness.targetHeadHeight <= 0.0) fail("fitness.target_head_height", "Must be positive");
    if (config.fitness.targetTorsoHeight <= 0.0) fail("fitness.target_torso_height", "Must be positive");
    if (config.fitness.positionRange <= 0.0) fail("fitness.position_range", "Must be positive");
    if (config.fitness.velocityRange <= 0.0) fail("fitness.velocity_range", "Must be positive");

    const PolicyConfig& p = config.policy;
    if (p.initialExploration > 1.0 || p.explorationFloor < 0.0 || p.explorationFloor > p.initialExploration) {
        fail("policy", "Need 0 <= exploration_floor <= initial_exploration <= 1");
    }
    if (p.explorationDecay <= 0.0 || p.explorationDecay > 1.0) fail("policy.exploration_decay", "Must be in (0, 1]");
    if (p.noiseScale < 0.0) fail("policy.noise_scale", "Must not be negative");

    if (config.actionFilter.maxChangeRate < 0.0) fail("action_filter.max_change_rate", "Must not be negative");
    if (config.actionFilter.smoothing < 0.0 || config.actionFilter.smoothing > 1.0) {
        fail("action_filter.smoothing", "Must be in [0, 1]");
    }

    if (config.buffer.capacity == 0 || config.buffer.retain == 0 || config.buffer.retain > config.buffer.capacity) {
        fail("buffer", "Need 0 < retain <= capacity");
    }

    const SchedulerConfig& s = config.scheduler;
    if (s.controlInterval <= 0.0) fail("scheduler.control_interval", "Must be positive");
    if (s.episodeDuration <= 0.0) fail("scheduler.episode_duration", "Must be positive");
    if (s.trainingInterval <= 0.0) fail("scheduler.training_interval", "Must be positive");
    if (s.settleDuration < 0.0) fail("scheduler.settle_duration", "Must not be negative");

    const TrainingConfig& t = config.training;
    if (t.epochs <= 0) fail("training.epochs", "Must be positive");
    if (t.batchSize <= 0) fail("training.batch_size", "Must be positive");
    if (t.learningRate <= 0.0) fail("training.learning_rate", "Must be positive");
    if (t.dropout < 0.0 || t.dropout >= 1.0) fail("training.dropout", "Must be in [0, 1)");
    if (t.replicationUnit <= 0.0f) fail("training.replication_unit", "Must be positive");
    if (t.topN == 0) fail("training.top_n", "Must be positive");

    if (config.actuation.deadband < 0.0) fail("actuation.deadband", "Must not be negative");
    if (config.dart.timeStep <= 0.0) fail("dart.time_step", "Must be positive");
}

Config parseConfig(const std::string& yaml) {
    Config config;
    try {
        config = fromNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw UprightError(ErrorCode::ConfigError, std::string("Failed to parse config: ") + e.what());
    }
    validateConfig(config);
    return config;
}

Config loadConfig(const std::string& path) {
    Config config;
    try {
        config = fromNode(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw UprightError(ErrorCode::ConfigError, path,
            std::string("Failed to load config: ") + e.what());
    }
    validateConfig(config);
    LOG_VERBOSE("[Config] Loaded " << path << " (morphology " << config.robot.morphology << ")");
    return config;
}

} // namespace upright
