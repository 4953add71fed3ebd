/**
 * @brief Unit tests for the x(y) quadratic fit
 */

#include "gtest/gtest.h"
#include "poly_fit.hpp"
#include <stdexcept>
#include <vector>

static void quadraticSamples(int n, std::vector<int>& ys, std::vector<int>& xs) {
    for (int y = 0; y < n; y++) {
        ys.push_back(y);
        xs.push_back(2*y*y + 3*y + 1);
    }
}

// Test: samples on x = 2y^2 + 3y + 1 give back its coefficients
TEST(PolyfitTest, RecoversKnownQuadratic) {
    std::vector<int> ys, xs;
    quadraticSamples(100, ys, xs);

    cv::Vec3d c;
    ASSERT_TRUE(polyfitXofY(ys, xs, 50, c));

    EXPECT_NEAR(c[0], 2.0, 1e-6);
    EXPECT_NEAR(c[1], 3.0, 1e-4);
    EXPECT_NEAR(c[2], 1.0, 1e-3);
}

// Test: a vertical line fits to a constant
TEST(PolyfitTest, VerticalLineIsConstant) {
    std::vector<int> ys, xs;
    for (int y = 0; y < 60; y++) {
        ys.push_back(y);
        xs.push_back(30);
    }

    cv::Vec3d c;
    ASSERT_TRUE(polyfitXofY(ys, xs, 10, c));

    EXPECT_NEAR(c[0], 0.0, 1e-8);
    EXPECT_NEAR(c[1], 0.0, 1e-6);
    EXPECT_NEAR(c[2], 30.0, 1e-4);
}

// Test: exactly minSamples points is not enough
TEST(PolyfitTest, CountAtThresholdDoesNotFit) {
    std::vector<int> ys, xs;
    quadraticSamples(10, ys, xs);

    cv::Vec3d c(7.0, 8.0, 9.0);
    EXPECT_FALSE(polyfitXofY(ys, xs, 10, c));
    EXPECT_EQ(c, cv::Vec3d(7.0, 8.0, 9.0));
}

// Test: one point above the threshold fits
TEST(PolyfitTest, CountAboveThresholdFits) {
    std::vector<int> ys, xs;
    quadraticSamples(11, ys, xs);

    cv::Vec3d c(7.0, 8.0, 9.0);
    ASSERT_TRUE(polyfitXofY(ys, xs, 10, c));
    EXPECT_NEAR(c[0], 2.0, 1e-6);
}

// Test: no samples never fit, even with a zero threshold
TEST(PolyfitTest, EmptyInputDoesNotFit) {
    std::vector<int> ys, xs;
    cv::Vec3d c;
    EXPECT_FALSE(polyfitXofY(ys, xs, 0, c));
}

TEST(PolyfitTest, MismatchedLengthsThrow) {
    std::vector<int> ys{1, 2, 3}, xs{1, 2};
    cv::Vec3d c;
    EXPECT_THROW(polyfitXofY(ys, xs, 0, c), cv::Exception);
}

// Test: evaluating a side without a fit is an error, not a read of garbage
TEST(EvalFitTest, MissingSideThrows) {
    LaneFit fit;
    fit.right = cv::Vec3d(0.0, 1.0, 2.0);
    fit.hasRight = true;

    EXPECT_THROW(evalFit(fit, LaneSide::Left, 10.0), std::runtime_error);
    EXPECT_DOUBLE_EQ(evalFit(fit, LaneSide::Right, 10.0), 12.0);
}

TEST(EvalFitTest, EvalPoly) {
    EXPECT_DOUBLE_EQ(evalPoly(cv::Vec3d(2.0, 3.0, 1.0), 4.0), 45.0);
}
