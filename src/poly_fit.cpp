#include "poly_fit.hpp"
#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>

bool polyfitXofY(const std::vector<int>& ys,
                 const std::vector<int>& xs,
                 int minSamples,
                 cv::Vec3d& coeffs_out) {
    CV_Assert(xs.size() == ys.size());
    if (ys.empty() || (long long)ys.size() <= (long long)minSamples) return false;

    cv::Mat A((int)ys.size(), 3, CV_64F);
    cv::Mat b((int)ys.size(), 1, CV_64F);

    for (int i = 0; i < (int)ys.size(); i++) {
        double y = ys[i];
        A.at<double>(i, 0) = y * y;
        A.at<double>(i, 1) = y;
        A.at<double>(i, 2) = 1.0;
        b.at<double>(i, 0) = xs[i];
    }

    cv::Mat x;
    bool ok = cv::solve(A, b, x, cv::DECOMP_SVD);
    if (!ok) return false;

    coeffs_out = cv::Vec3d(x.at<double>(0,0), x.at<double>(1,0), x.at<double>(2,0));
    return true;
}

double evalFit(const LaneFit& fit, LaneSide side, double y) {
    bool left = side == LaneSide::Left;
    if (left ? !fit.hasLeft : !fit.hasRight)
        throw std::runtime_error(std::string("no fit available for the ") +
                                 (left ? "left" : "right") + " lane");
    return evalPoly(left ? fit.left : fit.right, y);
}
