// Action post-processing tests

#include "upright/action_filter.hpp"
#include "upright/error.hpp"
#include "test_common.hpp"
#include <limits>

using namespace upright;

// ============================================================================
// Rate Limit + Smoothing Tests
// ============================================================================

void test_first_step_from_rest() {
    std::cout << "  test_first_step_from_rest..." << std::endl;

    ActionFilter filter(3);
    Eigen::VectorXf raw(3);
    raw << 1.0f, -1.0f, 0.01f;

    const Eigen::VectorXf& out = filter.apply(raw);
    // rate-limited to 0.05 then blended 0.7 new / 0.3 old
    ASSERT_NEAR(out[0], 0.035f, 1e-6f);
    ASSERT_NEAR(out[1], -0.035f, 1e-6f);
    ASSERT_NEAR(out[2], 0.007f, 1e-6f);
    ASSERT_TRUE(filter.lastAction().isApprox(out));
}

void test_consecutive_steps_accumulate() {
    std::cout << "  test_consecutive_steps_accumulate..." << std::endl;

    ActionFilter filter(1);
    Eigen::VectorXf raw = Eigen::VectorXf::Constant(1, 1.0f);
    filter.apply(raw);
    const Eigen::VectorXf& out = filter.apply(raw);
    ASSERT_NEAR(out[0], 0.07f, 1e-6f);
}

void test_change_never_exceeds_rate() {
    std::cout << "  test_change_never_exceeds_rate..." << std::endl;

    ActionFilter filter(4);
    Eigen::VectorXf previous = filter.lastAction();
    for (int t = 0; t < 200; ++t) {
        Eigen::VectorXf raw(4);
        raw << ((t % 2) ? 1.0f : -1.0f), 5.0f, -5.0f, std::sin(0.3f * t);
        Eigen::VectorXf out = filter.apply(raw);
        for (int i = 0; i < 4; ++i) {
            ASSERT_TRUE(std::abs(out[i] - previous[i]) <= 0.05f + 1e-6f);
            ASSERT_TRUE(out[i] >= -1.0f && out[i] <= 1.0f);
        }
        previous = out;
    }
}

void test_saturates_at_unit_range() {
    std::cout << "  test_saturates_at_unit_range..." << std::endl;

    ActionFilterConfig config;
    config.maxChangeRate = 1.0;
    config.smoothing = 1.0;
    ActionFilter filter(1, config);

    Eigen::VectorXf raw = Eigen::VectorXf::Constant(1, 3.0f);
    filter.apply(raw);
    filter.apply(raw);
    ASSERT_EQ(filter.lastAction()[0], 1.0f);
}

void test_non_finite_holds_previous() {
    std::cout << "  test_non_finite_holds_previous..." << std::endl;

    ActionFilter filter(2);
    Eigen::VectorXf raw = Eigen::VectorXf::Constant(2, 1.0f);
    filter.apply(raw);
    const float held = filter.lastAction()[0];

    raw[0] = std::numeric_limits<float>::quiet_NaN();
    raw[1] = std::numeric_limits<float>::infinity();
    const Eigen::VectorXf& out = filter.apply(raw);
    ASSERT_EQ(out[0], held);
    ASSERT_EQ(out[1], held);
    ASSERT_TRUE(out.allFinite());
}

void test_short_command_holds_tail() {
    std::cout << "  test_short_command_holds_tail..." << std::endl;

    ActionFilter filter(3);
    Eigen::VectorXf raw = Eigen::VectorXf::Constant(1, 1.0f);
    const Eigen::VectorXf& out = filter.apply(raw);
    ASSERT_EQ(out.size(), 3);
    ASSERT_NEAR(out[0], 0.035f, 1e-6f);
    ASSERT_EQ(out[1], 0.0f);
    ASSERT_EQ(out[2], 0.0f);
}

void test_reset_zeroes_command() {
    std::cout << "  test_reset_zeroes_command..." << std::endl;

    ActionFilter filter(2);
    filter.apply(Eigen::VectorXf::Constant(2, 1.0f));
    ASSERT_TRUE(filter.lastAction().norm() > 0.0f);
    filter.reset();
    ASSERT_EQ(filter.lastAction().norm(), 0.0f);
    ASSERT_EQ(filter.lastAction().size(), 2);
}

void test_invalid_config_throws() {
    std::cout << "  test_invalid_config_throws..." << std::endl;

    ActionFilterConfig bad;
    bad.smoothing = 1.5;
    ASSERT_THROWS(ActionFilter(2, bad), UprightError);

    bad = ActionFilterConfig();
    bad.maxChangeRate = -0.1;
    ASSERT_THROWS(ActionFilter(2, bad), UprightError);
}

void run_filter_tests() {
    std::cout << "=== Action Filter Tests ===" << std::endl;
    test_first_step_from_rest();
    test_consecutive_steps_accumulate();
    test_change_never_exceeds_rate();
    test_saturates_at_unit_range();
    test_non_finite_holds_previous();
    test_short_command_holds_tail();
    test_reset_zeroes_command();
    test_invalid_config_throws();
    std::cout << "  Action filter tests completed" << std::endl << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Action Filter Test Suite" << std::endl;
    std::cout << "========================================" << std::endl << std::endl;

    try {
        run_filter_tests();

        std::cout << "========================================" << std::endl;
        std::cout << "All tests completed successfully!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
