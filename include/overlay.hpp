#pragma once
#include <opencv2/core.hpp>
#include <vector>
#include "poly_fit.hpp"
#include "window_search.hpp"

struct PlotRange {
    double miny = 0.0;
    double maxy = 0.0;
};

struct CurveSamples {
    std::vector<double> ploty;
    std::vector<double> leftx;   // empty when the left lane has no fit
    std::vector<double> rightx;  // empty when the right lane has no fit
};

// [rows/3, rows-1], widened to cover the y of this pass's samples
PlotRange plotRange(int rows,
                    const std::vector<int>& lefty,
                    const std::vector<int>& righty);

std::vector<double> linspace(double start, double end, int num);

CurveSamples sampleCurves(const LaneFit& fit, const PlotRange& range, int count);

// black BGR image with lane points and the connecting segment per sample
cv::Mat renderOverlay(const cv::Size& size, const CurveSamples& samples);

void drawSearchWindow(cv::Mat& img, const SearchWindow& win);
