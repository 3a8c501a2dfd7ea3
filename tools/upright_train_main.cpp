// Headless training driver: DART world + one online-learning stand-up controller

#include "upright/upright.hpp"
#include "upright/dart_rig.hpp"
#include <boost/program_options.hpp>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace po = boost::program_options;

static const std::string DEFAULT_CONFIG = "config/upright.yaml";

static void printStatus(const upright::RobotController& controller, double simTime) {
    const auto& sched = controller.scheduler();
    std::cout << std::fixed << std::setprecision(2)
              << "[t=" << simTime << "s] episodes " << sched.episodeCount()
              << " | samples " << controller.buffer().size()
              << " | exploration " << controller.explorationRate()
              << " | best " << (controller.buffer().hasBest() ? controller.bestFitness() : 0.0f)
              << " | " << (controller.isTraining() ? "training" : "idle");
    if (!controller.fitnessHistory().empty()) {
        std::cout << " | last episode " << controller.fitnessHistory().back();
    }
    std::cout << std::endl;
}

int main(int argc, char** argv) {
    LOG_INFO("==============================================================================");
    LOG_INFO("upright_train - online stand-up learning");
    LOG_INFO("==============================================================================");
    LOG_PRINT_LEVEL();

    po::options_description desc("Training Options");
    desc.add_options()
        ("help,h", "Show this help message")
        ("config,c", po::value<std::string>()->default_value(DEFAULT_CONFIG), "Controller config YAML")
        ("morphology,m", po::value<std::string>(), "biped | quadruped | spider (overrides config)")
        ("duration,d", po::value<double>()->default_value(120.0), "Simulated seconds to run")
        ("speed,s", po::value<double>(), "Simulation speed multiplier (overrides config)")
        ("seed", po::value<uint32_t>(), "Seed for exploration and weight init")
        ("export-dir", po::value<std::string>(), "Directory for exported weights (overrides config)")
        ("export", "Export the model when the run ends")
        ("load", po::value<std::string>(), "Weight document to load before running")
        ("no-train", "Run the current policy without collecting samples")
        ("status-every", po::value<double>()->default_value(10.0), "Status line period in simulated seconds");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
    } catch (const po::error& e) {
        LOG_ERROR("Argument parsing error: " << e.what());
        std::cerr << desc << std::endl;
        return 1;
    }

    try {
        upright::Config config = upright::loadConfig(vm["config"].as<std::string>());

        if (vm.count("morphology")) config.robot.morphology = vm["morphology"].as<std::string>();
        if (vm.count("speed")) config.robot.simulationSpeed = vm["speed"].as<double>();
        if (vm.count("export-dir")) config.exports.directory = vm["export-dir"].as<std::string>();
        if (vm.count("export")) config.exports.onExit = true;
        if (vm.count("no-train")) config.robot.trainingActive = false;
        if (vm.count("seed")) {
            config.policy.seed = vm["seed"].as<uint32_t>();
            config.training.seed = vm["seed"].as<uint32_t>();
        }
        upright::validateConfig(config);

        upright::RobotController controller(config);
        upright::DartRig rig(controller.plan(), config.dart, config.sensors.groundLevel);

        controller.setResetCallback([&rig] { rig.restorePose(); });

        if (vm.count("load")) {
            upright::ImportResult loaded = controller.loadModel(vm["load"].as<std::string>());
            if (!loaded.success) {
                LOG_ERROR("Could not load weights: " << loaded.error);
                return 1;
            }
        }

        const double duration = vm["duration"].as<double>();
        const double statusEvery = vm["status-every"].as<double>();
        const double dt = config.dart.timeStep;
        double nextStatus = statusEvery;

        // One controller tick per physics step; speed scales episode/training thresholds only
        while (rig.time() < duration) {
            controller.step(rig.bodies(), dt);
            rig.step();

            if (statusEvery > 0.0 && rig.time() >= nextStatus) {
                printStatus(controller, rig.time());
                nextStatus += statusEvery;
            }
        }

        controller.waitForTraining();
        printStatus(controller, rig.time());

        if (config.exports.onExit) {
            upright::ExportResult exported = controller.exportModel(config.exports.directory);
            if (!exported.success) {
                LOG_ERROR("Export failed: " << exported.error);
                return 1;
            }
            std::cout << "Exported " << exported.path << std::endl;
        }
        return 0;
    } catch (const upright::UprightError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error: " << e.what());
        return 1;
    }
}
