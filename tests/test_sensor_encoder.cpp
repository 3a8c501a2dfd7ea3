// Sensor encoder tests

#include "upright/body_plan.hpp"
#include "upright/sensor_encoder.hpp"
#include "test_common.hpp"

using namespace upright;
using upright::testing::FakeRobot;

// ============================================================================
// Helpers
// ============================================================================

void test_fit_to_width() {
    std::cout << "  test_fit_to_width..." << std::endl;

    Eigen::VectorXf v(3);
    v << 1.0f, 2.0f, 3.0f;

    Eigen::VectorXf padded = fitToWidth(v, 5);
    ASSERT_EQ(padded.size(), 5);
    ASSERT_EQ(padded[2], 3.0f);
    ASSERT_EQ(padded[3], 0.0f);
    ASSERT_EQ(padded[4], 0.0f);

    Eigen::VectorXf cut = fitToWidth(v, 2);
    ASSERT_EQ(cut.size(), 2);
    ASSERT_EQ(cut[1], 2.0f);
}

void test_contact_value() {
    std::cout << "  test_contact_value..." << std::endl;

    ASSERT_NEAR(contactValue(0.0, 0.0, 0.1), 1.0f, 1e-6f);
    ASSERT_NEAR(contactValue(-0.3, 0.0, 0.1), 1.0f, 1e-6f);
    ASSERT_NEAR(contactValue(0.05, 0.0, 0.1), 0.5f, 1e-5f);
    ASSERT_NEAR(contactValue(0.1, 0.0, 0.1), 0.0f, 1e-6f);
    ASSERT_NEAR(contactValue(2.0, 0.0, 0.1), 0.0f, 1e-6f);

    // Zero threshold degenerates to a step
    ASSERT_EQ(contactValue(0.0, 0.0, 0.0), 1.0f);
    ASSERT_EQ(contactValue(0.01, 0.0, 0.0), 0.0f);
}

void run_helper_tests() {
    std::cout << "=== Encoder Helper Tests ===" << std::endl;
    test_fit_to_width();
    test_contact_value();
    std::cout << "  Encoder helper tests completed" << std::endl << std::endl;
}

// ============================================================================
// Encoding Tests
// ============================================================================

void test_biped_layout() {
    std::cout << "  test_biped_layout..." << std::endl;

    using namespace sensor_index;
    BipedPlan plan;
    FakeRobot robot(plan, 1.0);
    robot.body("torso").setVelocity(Eigen::Vector3d(0.1, 0.2, 0.3));
    robot.body("torso").setAngular(Eigen::Vector3d(0.4, 0.5, 0.6));
    robot.body("torso").setRotation(Eigen::Quaterniond(Eigen::AngleAxisd(0.3, Eigen::Vector3d::UnitX())));
    robot.body("head").setVelocity(Eigen::Vector3d(-1.0, -2.0, -3.0));

    SensorEncoder encoder(plan);
    auto reading = encoder.encode(robot.rig(), 0.05);
    ASSERT_TRUE(reading.has_value());

    const Eigen::VectorXf& v = reading->values;
    ASSERT_EQ(v.size(), 28);

    const double headY = robot.body("head").translation().y();
    const double torsoY = robot.body("torso").translation().y();
    ASSERT_NEAR(v[HeadY], headY, 1e-5);
    ASSERT_NEAR(v[TorsoY], torsoY, 1e-5);
    ASSERT_NEAR(v[TorsoX], 0.0, 1e-6);

    const double comY = (headY + torsoY + robot.body("left_thigh").translation().y() +
                         robot.body("right_thigh").translation().y()) / 4.0;
    ASSERT_NEAR(v[CenterOfMassY], comY, 1e-5);

    ASSERT_NEAR(v[HeadVel + 1], -2.0f, 1e-6f);
    ASSERT_NEAR(v[TorsoVel + 2], 0.3f, 1e-6f);
    ASSERT_NEAR(v[AngVelX], 0.4f, 1e-6f);
    ASSERT_NEAR(v[AngVelZ], 0.6f, 1e-6f);

    ASSERT_NEAR(v[RotX], std::sin(0.15), 1e-5);
    ASSERT_NEAR(v[RotW], std::cos(0.15), 1e-5);
    ASSERT_NEAR(v[RotY], 0.0, 1e-6);

    // Thigh straight above shin in the rest pose
    ASSERT_NEAR(v[LeftKnee], M_PI / 2.0, 1e-5);
    ASSERT_NEAR(v[RightKnee], M_PI / 2.0, 1e-5);

    // Limb block: thigh heights, foot heights, contacts
    ASSERT_NEAR(v[22], robot.body("left_thigh").translation().y(), 1e-5);
    ASSERT_NEAR(v[23], robot.body("right_thigh").translation().y(), 1e-5);
    ASSERT_NEAR(v[24], robot.body("left_foot").translation().y(), 1e-5);
    ASSERT_NEAR(v[25], robot.body("right_foot").translation().y(), 1e-5);
}

void test_acceleration_needs_history() {
    std::cout << "  test_acceleration_needs_history..." << std::endl;

    using namespace sensor_index;
    BipedPlan plan;
    FakeRobot robot(plan, 1.0);
    SensorEncoder encoder(plan);

    robot.body("head").setVelocity(Eigen::Vector3d(0.0, 1.0, 0.0));
    auto first = encoder.encode(robot.rig(), 0.05);
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(first->values[HeadAccY], 0.0f);
    ASSERT_TRUE(encoder.hasHistory());

    robot.body("head").setVelocity(Eigen::Vector3d(0.0, 0.5, 0.0));
    robot.body("torso").setVelocity(Eigen::Vector3d(0.1, 0.0, 0.0));
    auto second = encoder.encode(robot.rig(), 0.05);
    ASSERT_NEAR(second->values[HeadAccY], -10.0f, 1e-4f);
    ASSERT_NEAR(second->values[TorsoAcc], 2.0f, 1e-4f);

    // Non-positive delta yields zero acceleration
    robot.body("head").setVelocity(Eigen::Vector3d(0.0, 3.0, 0.0));
    auto third = encoder.encode(robot.rig(), 0.0);
    ASSERT_EQ(third->values[HeadAccY], 0.0f);

    encoder.reset();
    ASSERT_FALSE(encoder.hasHistory());
    robot.body("head").setVelocity(Eigen::Vector3d(0.0, -3.0, 0.0));
    auto fourth = encoder.encode(robot.rig(), 0.05);
    ASSERT_EQ(fourth->values[HeadAccY], 0.0f);
}

void test_missing_head_or_torso_skips() {
    std::cout << "  test_missing_head_or_torso_skips..." << std::endl;

    BipedPlan plan;
    FakeRobot robot(plan, 1.0);
    SensorEncoder encoder(plan);

    robot.body("head").setLive(false);
    ASSERT_FALSE(encoder.encode(robot.rig(), 0.05).has_value());
    ASSERT_FALSE(encoder.hasHistory());

    robot.body("head").setLive(true);
    robot.body("torso").setLive(false);
    ASSERT_FALSE(encoder.encode(robot.rig(), 0.05).has_value());

    BodyRig empty;
    ASSERT_FALSE(encoder.encode(empty, 0.05).has_value());
}

void test_missing_limb_reads_zero() {
    std::cout << "  test_missing_limb_reads_zero..." << std::endl;

    BipedPlan plan;
    FakeRobot robot(plan, 1.0);
    robot.body("right_foot").setLive(false);

    SensorEncoder encoder(plan);
    auto reading = encoder.encode(robot.rig(), 0.05);
    ASSERT_TRUE(reading.has_value());
    ASSERT_EQ(reading->values[25], 0.0f);
    ASSERT_EQ(reading->values[27], 0.0f);
    ASSERT_EQ(reading->contact.right, 0.0f);
    ASSERT_FALSE(reading->contact.rightDown);
}

void test_ground_contact_summary() {
    std::cout << "  test_ground_contact_summary..." << std::endl;

    BipedPlan plan;
    FakeRobot robot(plan, 1.0);
    SensorEncoder encoder(plan);

    robot.body("left_foot").setPosition(Eigen::Vector3d(-0.12, 0.0, 0.0));
    robot.body("right_foot").setPosition(Eigen::Vector3d(0.12, 0.5, 0.0));
    auto reading = encoder.encode(robot.rig(), 0.05);

    ASSERT_EQ(reading->contact.limbs.size(), 2u);
    ASSERT_NEAR(reading->contact.left, 1.0f, 1e-6f);
    ASSERT_NEAR(reading->contact.right, 0.0f, 1e-6f);
    ASSERT_TRUE(reading->contact.leftDown);
    ASSERT_FALSE(reading->contact.rightDown);
    ASSERT_FALSE(reading->contact.both);
    ASSERT_EQ(reading->contact.feetDown(), 1);
    ASSERT_NEAR(reading->values[26], 1.0f, 1e-6f);
    ASSERT_NEAR(reading->values[27], 0.0f, 1e-6f);

    robot.body("right_foot").setPosition(Eigen::Vector3d(0.12, 0.02, 0.0));
    reading = encoder.encode(robot.rig(), 0.05);
    ASSERT_TRUE(reading->contact.both);
    ASSERT_TRUE(reading->contact.stable);
    ASSERT_EQ(reading->contact.feetDown(), 2);
}

void test_quadruped_truncates_to_sensor_count() {
    std::cout << "  test_quadruped_truncates_to_sensor_count..." << std::endl;

    QuadrupedPlan plan;
    FakeRobot robot(plan, 5.0);
    robot.body("front_left_foot").setPosition(Eigen::Vector3d(0.0, 0.0, 0.0));
    robot.body("back_right_foot").setPosition(Eigen::Vector3d(0.0, 0.0, 0.0));

    SensorEncoder encoder(plan);
    auto reading = encoder.encode(robot.rig(), 0.05);
    ASSERT_EQ(reading->values.size(), 32);

    // 22 common + 4 thighs + 4 feet, then the first two contacts survive
    ASSERT_NEAR(reading->values[30], 1.0f, 1e-6f);
    ASSERT_NEAR(reading->values[31], 0.0f, 1e-6f);

    // The summary still sees every foot
    ASSERT_EQ(reading->contact.limbs.size(), 4u);
    ASSERT_NEAR(reading->contact.limbs[3], 1.0f, 1e-6f);
}

void test_spider_fills_sensor_count() {
    std::cout << "  test_spider_fills_sensor_count..." << std::endl;

    SpiderPlan plan;
    FakeRobot robot(plan, 1.0);
    SensorEncoder encoder(plan);
    auto reading = encoder.encode(robot.rig(), 0.05);
    ASSERT_EQ(reading->values.size(), 40);
    ASSERT_NEAR(reading->values[22], robot.body("front_left_thigh").translation().y(), 1e-5);
    ASSERT_NEAR(reading->values[27], robot.body("back_right_thigh").translation().y(), 1e-5);
}

void test_ground_level_offset() {
    std::cout << "  test_ground_level_offset..." << std::endl;

    BipedPlan plan;
    FakeRobot robot(plan, 3.0);
    SensorConfig config;
    config.groundLevel = 2.0;

    robot.body("left_foot").setPosition(Eigen::Vector3d(-0.12, 2.0, 0.0));
    robot.body("right_foot").setPosition(Eigen::Vector3d(0.12, 2.0, 0.0));
    SensorEncoder encoder(plan, config);
    auto reading = encoder.encode(robot.rig(), 0.05);
    ASSERT_TRUE(reading->contact.both);
}

void run_encoding_tests() {
    std::cout << "=== Encoding Tests ===" << std::endl;
    test_biped_layout();
    test_acceleration_needs_history();
    test_missing_head_or_torso_skips();
    test_missing_limb_reads_zero();
    test_ground_contact_summary();
    test_quadruped_truncates_to_sensor_count();
    test_spider_fills_sensor_count();
    test_ground_level_offset();
    std::cout << "  Encoding tests completed" << std::endl << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Sensor Encoder Test Suite" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    try {
        run_helper_tests();
        run_encoding_tests();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests completed successfully!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
