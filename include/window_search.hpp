#pragma once
#include <opencv2/core.hpp>
#include <functional>
#include <vector>
#include "histogram.hpp"
#include "lane_side.hpp"

// x and y of every foreground pixel, row-major order
struct ForegroundPixels {
    std::vector<int> xs;
    std::vector<int> ys;
};

struct SearchWindow {
    cv::Point center;
    int margin = 0;  // half-width
    int height = 0;

    cv::Point topLeft() const { return {center.x - margin, center.y - height/2}; }
    cv::Point bottomRight() const { return {center.x + margin, center.y + height/2}; }
};

struct LanePixels {
    std::vector<int> leftx, lefty;
    std::vector<int> rightx, righty;
    LaneBases bases;
};

// called once per band and side while searching, for debug drawing only
using WindowObserver = std::function<void(const SearchWindow&, LaneSide)>;

ForegroundPixels extractFeatures(const cv::Mat& binary);

// appends the foreground pixels inside the (inclusive) window to xs/ys,
// returns how many were appended
int pixelsInWindow(const SearchWindow& win,
                   const ForegroundPixels& features,
                   std::vector<int>& xs,
                   std::vector<int>& ys);

LanePixels findLanePixels(const cv::Mat& binary,
                          int nwindows, int margin, int minpix,
                          const WindowObserver& observer = WindowObserver());
