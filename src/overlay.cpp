#include "overlay.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

static const cv::Scalar kPointColor(255, 0, 255);
static const cv::Scalar kSegmentColor(0, 255, 0);
static const cv::Scalar kWindowColor(255, 0, 0);

// off-image for any real mask and small enough for the fixed-point drawing
// code; NaN maps to the limit
static const double kDrawLimit = 32767.0;

static int drawableX(double x) {
    return (int)std::max(-kDrawLimit, std::min(kDrawLimit, x));
}

PlotRange plotRange(int rows,
                    const std::vector<int>& lefty,
                    const std::vector<int>& righty) {
    PlotRange r;
    r.maxy = rows - 1;
    r.miny = rows / 3;

    if (!lefty.empty()) {
        auto mm = std::minmax_element(lefty.begin(), lefty.end());
        r.miny = std::min(r.miny, (double)*mm.first);
        r.maxy = std::max(r.maxy, (double)*mm.second);
    }
    if (!righty.empty()) {
        auto mm = std::minmax_element(righty.begin(), righty.end());
        r.miny = std::min(r.miny, (double)*mm.first);
        r.maxy = std::max(r.maxy, (double)*mm.second);
    }
    return r;
}

std::vector<double> linspace(double start, double end, int num) {
    std::vector<double> out;
    if (num <= 0) return out;
    out.reserve(num);
    if (num == 1) {
        out.push_back(start);
        return out;
    }

    double step = (end - start) / (num - 1);
    for (int i = 0; i < num - 1; i++)
        out.push_back(start + i * step);
    out.push_back(end);
    return out;
}

CurveSamples sampleCurves(const LaneFit& fit, const PlotRange& range, int count) {
    CurveSamples s;
    s.ploty = linspace(range.miny, range.maxy, count);

    for (double y : s.ploty) {
        if (fit.hasLeft)  s.leftx.push_back(evalPoly(fit.left, y));
        if (fit.hasRight) s.rightx.push_back(evalPoly(fit.right, y));
    }
    return s;
}

cv::Mat renderOverlay(const cv::Size& size, const CurveSamples& samples) {
    cv::Mat out = cv::Mat::zeros(size, CV_8UC3);

    bool hasLeft = samples.leftx.size() == samples.ploty.size();
    bool hasRight = samples.rightx.size() == samples.ploty.size();

    for (size_t i = 0; i < samples.ploty.size(); i++) {
        int y = (int)samples.ploty[i];

        int l = hasLeft ? drawableX(samples.leftx[i]) : 0;
        int r = hasRight ? drawableX(samples.rightx[i]) : 0;

        if (hasLeft)
            cv::circle(out, {l, y}, 5, kPointColor, -1);
        if (hasRight)
            cv::circle(out, {r, y}, 5, kPointColor, -1);
        if (hasLeft && hasRight)
            cv::line(out, {l, y}, {r, y}, kSegmentColor);
    }
    return out;
}

void drawSearchWindow(cv::Mat& img, const SearchWindow& win) {
    cv::rectangle(img, win.topLeft(), win.bottomRight(), kWindowColor, 2);
}
