#pragma once
#include <opencv2/core.hpp>
#include <utility>
#include "config.hpp"
#include "overlay.hpp"
#include "poly_fit.hpp"
#include "window_search.hpp"

struct LaneResult {
    LanePixels pixels;
    CurveSamples curves;
    cv::Mat overlay;      // CV_8UC3, same size as the input
    bool leftUpdated = false;
    bool rightUpdated = false;
};

// Sliding-window lane finder for bird's-eye binary images.
//
// Only the configuration and the last fit of each lane live on the detector.
// A pass that collects too few pixels for a lane keeps that lane's previous
// fit. Passes on one instance must not overlap.
class LaneDetector {
public:
    explicit LaneDetector(const DetectorConfig& cfg = DetectorConfig());

    LaneResult detect(const cv::Mat& warpedBinary,
                      const WindowObserver& observer = WindowObserver());

    // detect() reduced to the rendered overlay
    cv::Mat forward(const cv::Mat& warpedBinary,
                    const WindowObserver& observer = WindowObserver());

    LanePixels findLanePixels(const cv::Mat& warpedBinary,
                              const WindowObserver& observer = WindowObserver()) const;

    // refits each lane that has enough samples; returns {left, right} updated
    std::pair<bool, bool> refit(const LanePixels& pixels);

    const LaneFit& fit() const { return fit_; }
    const DetectorConfig& config() const { return cfg_; }

private:
    DetectorConfig cfg_;
    LaneFit fit_;
};
