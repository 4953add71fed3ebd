#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "lane_side.hpp"

struct LaneFit {
    cv::Vec3d left;
    cv::Vec3d right;
    bool hasLeft = false;
    bool hasRight = false;
};

// Least-squares fit of x = A*y^2 + B*y + C. Returns false, leaving coeffs_out
// untouched, unless there are more than minSamples points.
bool polyfitXofY(const std::vector<int>& ys,
                 const std::vector<int>& xs,
                 int minSamples,
                 cv::Vec3d& coeffs_out);

inline double evalPoly(const cv::Vec3d& c, double y) {
    return c[0]*y*y + c[1]*y + c[2];
}

// throws std::runtime_error when that side has never been fitted
double evalFit(const LaneFit& fit, LaneSide side, double y);
