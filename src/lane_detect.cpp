#include "lane_detect.hpp"
#include <opencv2/core.hpp>
#include <utility>

LaneDetector::LaneDetector(const DetectorConfig& cfg) : cfg_(cfg) {
    CV_Assert(isValidConfig(cfg_));
}

LanePixels LaneDetector::findLanePixels(const cv::Mat& warpedBinary,
                                        const WindowObserver& observer) const {
    return ::findLanePixels(warpedBinary, cfg_.nwindows, cfg_.margin,
                            cfg_.minpix, observer);
}

std::pair<bool, bool> LaneDetector::refit(const LanePixels& pixels) {
    bool okL = polyfitXofY(pixels.lefty, pixels.leftx, cfg_.minfit, fit_.left);
    bool okR = polyfitXofY(pixels.righty, pixels.rightx, cfg_.minfit, fit_.right);

    if (okL) fit_.hasLeft = true;
    if (okR) fit_.hasRight = true;
    return {okL, okR};
}

LaneResult LaneDetector::detect(const cv::Mat& warpedBinary,
                                const WindowObserver& observer) {
    // single channel 2-D mask only
    CV_Assert(warpedBinary.dims == 2 && warpedBinary.channels() == 1);

    LaneResult result;
    result.pixels = findLanePixels(warpedBinary, observer);

    std::pair<bool, bool> updated = refit(result.pixels);
    result.leftUpdated = updated.first;
    result.rightUpdated = updated.second;

    PlotRange range = plotRange(warpedBinary.rows,
                                result.pixels.lefty, result.pixels.righty);
    result.curves = sampleCurves(fit_, range, warpedBinary.rows);
    result.overlay = renderOverlay(warpedBinary.size(), result.curves);
    return result;
}

cv::Mat LaneDetector::forward(const cv::Mat& warpedBinary,
                              const WindowObserver& observer) {
    return detect(warpedBinary, observer).overlay;
}
