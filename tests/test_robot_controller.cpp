// Actuation and end-to-end controller tests against scripted bodies

#include "upright/actuator.hpp"
#include "upright/error.hpp"
#include "upright/robot_controller.hpp"
#include "test_common.hpp"
#include <limits>

using namespace upright;
using upright::testing::FakeRobot;

namespace {

const double kFrame = 0.125;

// Feet just inside the contact band, everything level and still
const double kStandingHeight = 1.19;

Config exactConfig() {
    Config config;
    config.scheduler.controlInterval = 0.25;
    config.scheduler.episodeDuration = 1.0;
    config.scheduler.trainingInterval = 2.0;
    config.training.async = false;
    config.training.epochs = 3;
    config.training.seed = 1;
    config.policy.seed = 1;
    return config;
}

void run(RobotController& controller, FakeRobot& robot, int frames) {
    for (int i = 0; i < frames; ++i) {
        controller.step(robot.rig(), kFrame);
    }
}

} // namespace

// ============================================================================
// Actuator Tests
// ============================================================================

void test_actuator_torque_mapping() {
    std::cout << "  test_actuator_torque_mapping..." << std::endl;

    BipedPlan plan;
    FakeRobot robot(plan);
    Actuator actuator(plan);
    ASSERT_NEAR(actuator.motorStrength(), 0.00625, 1e-12);

    Eigen::VectorXf command = Eigen::VectorXf::Zero(8);
    command[0] = 0.5f;    // left hip
    command[3] = -1.0f;   // right knee
    command[7] = 0.01f;   // head, inside the deadband

    ASSERT_EQ(actuator.apply(robot.rig(), command), 2);

    const auto& hip = robot.body("left_thigh").torques();
    ASSERT_EQ(hip.size(), 1u);
    ASSERT_NEAR(hip[0].x(), 0.4 * 0.5 * 0.00625, 1e-12);
    ASSERT_NEAR(hip[0].y(), 0.0, 1e-12);
    ASSERT_NEAR(hip[0].z(), 0.2 * 0.5 * 0.00625, 1e-12);

    const auto& knee = robot.body("right_shin").torques();
    ASSERT_EQ(knee.size(), 1u);
    ASSERT_NEAR(knee[0].x(), -0.3 * 0.00625, 1e-12);

    ASSERT_TRUE(robot.body("head").torques().empty());
}

void test_actuator_strength_override() {
    std::cout << "  test_actuator_strength_override..." << std::endl;

    QuadrupedPlan plan;
    ActuationConfig config;
    config.motorStrength = 0.1;
    config.deadband = 0.0;
    Actuator actuator(plan, config);
    ASSERT_EQ(actuator.motors().size(), 12u);

    Eigen::Vector3d t = actuator.torqueFor(6, 1.0f);
    ASSERT_EQ(actuator.motors()[6].part, "back_left_thigh");
    ASSERT_NEAR(t.x(), 0.04, 1e-12);
    ASSERT_NEAR(t.z(), 0.02, 1e-12);
}

void test_actuator_drops_failing_joints_only() {
    std::cout << "  test_actuator_drops_failing_joints_only..." << std::endl;

    BipedPlan plan;
    FakeRobot robot(plan);
    Actuator actuator(plan);

    robot.body("left_thigh").setFailing(true);
    robot.body("right_thigh").setLive(false);

    Eigen::VectorXf command = Eigen::VectorXf::Constant(8, 0.5f);
    command[2] = std::numeric_limits<float>::quiet_NaN();

    // 8 motors: one throws, one is not live, one is NaN
    ASSERT_EQ(actuator.apply(robot.rig(), command), 5);
    ASSERT_EQ(actuator.failures(), 1u);
    ASSERT_TRUE(robot.body("left_shin").torques().empty());
    ASSERT_EQ(robot.body("torso").torques().size(), 1u);

    // Short commands drive only the leading motors
    robot.body("left_thigh").setFailing(false);
    ASSERT_EQ(actuator.apply(robot.rig(), Eigen::VectorXf::Constant(1, 0.5f)), 1);
}

void run_actuator_tests() {
    std::cout << "=== Actuator Tests ===" << std::endl;
    test_actuator_torque_mapping();
    test_actuator_strength_override();
    test_actuator_drops_failing_joints_only();
    std::cout << "  Actuator tests completed" << std::endl << std::endl;
}

// ============================================================================
// Controller Loop Tests
// ============================================================================

void test_first_step_creates_model() {
    std::cout << "  test_first_step_creates_model..." << std::endl;

    RobotController controller(exactConfig());
    FakeRobot robot(controller.plan(), kStandingHeight);
    ASSERT_FALSE(controller.isInitialized());
    ASSERT_EQ(controller.morphology().key, "biped");

    controller.step(robot.rig(), kFrame);
    ASSERT_TRUE(controller.isInitialized());
    ASSERT_TRUE(controller.scheduler().state() == SchedulerState::Running);
    ASSERT_EQ(controller.stepCount(), 0u);
    ASSERT_FALSE(controller.telemetry().latest().has_value());

    controller.step(robot.rig(), kFrame);
    ASSERT_EQ(controller.stepCount(), 1u);
    ASSERT_TRUE(controller.explorationRate() < 1.0);
    ASSERT_TRUE(controller.lastAction().norm() > 0.0f);

    auto snapshot = controller.telemetry().latest();
    ASSERT_TRUE(snapshot.has_value());
    ASSERT_EQ(snapshot->tick, 1u);
    ASSERT_EQ(snapshot->sensors.size(), 28u);
    ASSERT_TRUE(snapshot->contact.both);
    ASSERT_EQ(snapshot->fitness, 100.0f);
}

void test_missing_core_bodies_skip_frame() {
    std::cout << "  test_missing_core_bodies_skip_frame..." << std::endl;

    RobotController controller(exactConfig());
    FakeRobot robot(controller.plan(), kStandingHeight);
    robot.body("head").setLive(false);

    run(controller, robot, 10);
    ASSERT_EQ(controller.scheduler().episode().elapsed, 0.0);
    ASSERT_EQ(controller.stepCount(), 0u);
    ASSERT_EQ(robot.torqueCount(), 0u);

    robot.body("head").setLive(true);
    run(controller, robot, 2);
    ASSERT_EQ(controller.stepCount(), 1u);
}

void test_episode_collects_one_sample() {
    std::cout << "  test_episode_collects_one_sample..." << std::endl;

    RobotController controller(exactConfig());
    FakeRobot robot(controller.plan(), kStandingHeight);

    int resets = 0;
    std::vector<EpisodeSummary> episodes;
    controller.setResetCallback([&resets] { ++resets; });
    controller.setEpisodeCallback([&episodes](const EpisodeSummary& s) { episodes.push_back(s); });

    run(controller, robot, 8);
    ASSERT_EQ(resets, 1);
    ASSERT_EQ(episodes.size(), 1u);
    ASSERT_TRUE(episodes[0].reason == EpisodeEnd::Timeout);
    ASSERT_EQ(episodes[0].ticks, 3);
    ASSERT_EQ(controller.buffer().size(), 1u);

    const ExperienceSample& s = controller.buffer().back();
    ASSERT_EQ(s.state.size(), 28);
    ASSERT_EQ(s.action.size(), 8);
    ASSERT_NEAR(s.fitness, 100.0f, 1e-4f);
    ASSERT_TRUE(s.action.isApprox(controller.lastAction()));

    ASSERT_EQ(controller.fitnessHistory().size(), 1u);
    ASSERT_TRUE(controller.scheduler().state() == SchedulerState::Running);

    run(controller, robot, 8);
    ASSERT_EQ(controller.buffer().size(), 2u);
    ASSERT_EQ(resets, 2);
}

void test_boundary_exit_resets_pose() {
    std::cout << "  test_boundary_exit_resets_pose..." << std::endl;

    RobotController controller(exactConfig());
    FakeRobot robot(controller.plan(), kStandingHeight);

    std::vector<EpisodeEnd> reasons;
    controller.setEpisodeCallback([&reasons](const EpisodeSummary& s) { reasons.push_back(s.reason); });
    controller.setResetCallback([&robot] { robot.translate(Eigen::Vector3d(-20.0, 0.0, 0.0)); });

    run(controller, robot, 3);
    robot.translate(Eigen::Vector3d(20.0, 0.0, 0.0));
    run(controller, robot, 1);

    ASSERT_EQ(reasons.size(), 1u);
    ASSERT_TRUE(reasons[0] == EpisodeEnd::Boundary);
    ASSERT_EQ(controller.buffer().size(), 1u);

    // Pose restored by the callback: the next frame runs a fresh episode
    run(controller, robot, 1);
    ASSERT_EQ(reasons.size(), 1u);
    ASSERT_EQ(controller.scheduler().episode().elapsed, kFrame);
}

void test_reset_callback_failure_is_contained() {
    std::cout << "  test_reset_callback_failure_is_contained..." << std::endl;

    RobotController controller(exactConfig());
    FakeRobot robot(controller.plan(), kStandingHeight);
    controller.setResetCallback([] { throw std::runtime_error("pose restore failed"); });

    run(controller, robot, 8);
    ASSERT_EQ(controller.buffer().size(), 1u);
    ASSERT_TRUE(controller.scheduler().state() == SchedulerState::Running);
}

void test_paused_training_collects_nothing() {
    std::cout << "  test_paused_training_collects_nothing..." << std::endl;

    RobotController controller(exactConfig());
    FakeRobot robot(controller.plan(), kStandingHeight);
    controller.setTrainingActive(false);

    run(controller, robot, 24);
    ASSERT_EQ(controller.buffer().size(), 0u);
    ASSERT_EQ(controller.fitnessHistory().size(), 3u);
    ASSERT_TRUE(controller.stepCount() > 0u);

    controller.setTrainingActive(true);
    run(controller, robot, 8);
    ASSERT_EQ(controller.buffer().size(), 1u);
}

void test_actuation_follows_last_action() {
    std::cout << "  test_actuation_follows_last_action..." << std::endl;

    Config config = exactConfig();
    config.actuation.deadband = 0.0;
    RobotController controller(config);
    FakeRobot robot(controller.plan(), kStandingHeight);

    // No command yet: zero action produces no torque
    controller.step(robot.rig(), kFrame);
    ASSERT_EQ(robot.torqueCount(), 0u);

    // Control tick, then a frame in between ticks: both apply the same command
    controller.step(robot.rig(), kFrame);
    controller.step(robot.rig(), kFrame);
    const auto& torques = robot.body("left_thigh").torques();
    ASSERT_EQ(torques.size(), 2u);
    ASSERT_TRUE(torques[0].isApprox(torques[1]));
}

void run_loop_tests() {
    std::cout << "=== Controller Loop Tests ===" << std::endl;
    test_first_step_creates_model();
    test_missing_core_bodies_skip_frame();
    test_episode_collects_one_sample();
    test_boundary_exit_resets_pose();
    test_reset_callback_failure_is_contained();
    test_paused_training_collects_nothing();
    test_actuation_follows_last_action();
    std::cout << "  Controller loop tests completed" << std::endl << std::endl;
}

// ============================================================================
// Training and Reset Tests
// ============================================================================

void test_train_now_needs_three_good_samples() {
    std::cout << "  test_train_now_needs_three_good_samples..." << std::endl;

    RobotController controller(exactConfig());
    FakeRobot robot(controller.plan(), kStandingHeight);

    run(controller, robot, 16);
    ASSERT_EQ(controller.buffer().size(), 2u);
    FitResult refused = controller.trainNow();
    ASSERT_TRUE(refused.status == FitStatus::InsufficientData);
    ASSERT_FALSE(controller.isTraining());

    run(controller, robot, 8);
    ASSERT_EQ(controller.buffer().size(), 3u);
    FitResult trained = controller.trainNow();
    ASSERT_TRUE(trained.trained());
    ASSERT_TRUE(controller.lastFitResult().has_value());
    ASSERT_TRUE(controller.lastFitResult()->trained());
}

void test_scheduled_background_training() {
    std::cout << "  test_scheduled_background_training..." << std::endl;

    Config config = exactConfig();
    config.training.async = true;
    RobotController controller(config);
    FakeRobot robot(controller.plan(), kStandingHeight);

    // Three episodes fill the buffer, the overdue training timer fires right after
    run(controller, robot, 25);
    ASSERT_EQ(controller.buffer().size(), 3u);
    controller.waitForTraining();

    ASSERT_FALSE(controller.isTraining());
    ASSERT_TRUE(controller.lastFitResult().has_value());
    ASSERT_TRUE(controller.lastFitResult()->trained());
}

void test_reset_model_keeps_samples() {
    std::cout << "  test_reset_model_keeps_samples..." << std::endl;

    RobotController controller(exactConfig());
    FakeRobot robot(controller.plan(), kStandingHeight);
    run(controller, robot, 16);

    ControllerNet before = controller.models().network();
    controller.resetModel();
    ASSERT_TRUE(controller.isInitialized());
    ASSERT_TRUE(controller.models().network() != before);
    ASSERT_EQ(controller.buffer().size(), 2u);
}

void test_reset_all_restores_defaults() {
    std::cout << "  test_reset_all_restores_defaults..." << std::endl;

    RobotController controller(exactConfig());
    FakeRobot robot(controller.plan(), kStandingHeight);
    run(controller, robot, 20);
    controller.setSimulationSpeed(4.0);
    controller.setTrainingActive(false);

    controller.resetAll();
    ASSERT_FALSE(controller.isInitialized());
    ASSERT_EQ(controller.buffer().size(), 0u);
    ASSERT_EQ(controller.stepCount(), 0u);
    ASSERT_TRUE(controller.fitnessHistory().empty());
    ASSERT_TRUE(controller.scheduler().state() == SchedulerState::Idle);
    ASSERT_EQ(controller.simulationSpeed(), 1.0);
    ASSERT_TRUE(controller.trainingActive());
    ASSERT_NEAR(controller.explorationRate(), 1.0, 1e-12);
    ASSERT_EQ(controller.lastAction().norm(), 0.0f);
    ASSERT_FALSE(controller.telemetry().latest().has_value());

    // The next frame starts over with a fresh model
    controller.step(robot.rig(), kFrame);
    ASSERT_TRUE(controller.isInitialized());
}

void test_fitness_history_is_bounded() {
    std::cout << "  test_fitness_history_is_bounded..." << std::endl;

    Config config = exactConfig();
    config.robot.fitnessHistory = 2;
    RobotController controller(config);
    FakeRobot robot(controller.plan(), kStandingHeight);
    run(controller, robot, 40);
    ASSERT_EQ(controller.fitnessHistory().size(), 2u);
}

void test_invalid_morphology_rejected() {
    std::cout << "  test_invalid_morphology_rejected..." << std::endl;

    Config config;
    config.robot.morphology = "octopus";
    ASSERT_THROWS(RobotController{config}, UprightError);

    config.robot.morphology = "spider";
    RobotController spider(config);
    ASSERT_EQ(spider.morphology().motorCount, 18);
    ASSERT_THROWS(spider.setSimulationSpeed(0.0), UprightError);
}

void run_training_tests() {
    std::cout << "=== Controller Training Tests ===" << std::endl;
    test_train_now_needs_three_good_samples();
    test_scheduled_background_training();
    test_reset_model_keeps_samples();
    test_reset_all_restores_defaults();
    test_fitness_history_is_bounded();
    test_invalid_morphology_rejected();
    std::cout << "  Controller training tests completed" << std::endl << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Robot Controller Test Suite" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    try {
        run_actuator_tests();
        run_loop_tests();
        run_training_tests();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests completed successfully!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
