#include "histogram.hpp"
#include <opencv2/core.hpp>

cv::Mat bottomHalfHistogram(const cv::Mat& binary) {
    CV_Assert(binary.dims == 2 && binary.channels() == 1);

    // reduce has no 8S/32S -> 64F sum, so widen first
    cv::Mat bottomHalf;
    binary.rowRange(binary.rows/2, binary.rows).convertTo(bottomHalf, CV_64F);

    cv::Mat histogram;
    cv::reduce(bottomHalf, histogram, 0, cv::REDUCE_SUM, CV_64F);
    return histogram;
}

LaneBases findLaneBases(const cv::Mat& binary) {
    // both halves must hold at least one column
    CV_Assert(binary.cols >= 2 && binary.rows >= 1);

    cv::Mat hist = bottomHalfHistogram(binary);
    int mid = hist.cols / 2;

    // minMaxLoc reports the first maximum, so a flat profile gives 0 and mid
    double minValL, maxValL, minValR, maxValR;
    cv::Point minLocL, maxLocL, minLocR, maxLocR;

    cv::minMaxLoc(hist.colRange(0, mid), &minValL, &maxValL, &minLocL, &maxLocL);
    cv::minMaxLoc(hist.colRange(mid, hist.cols), &minValR, &maxValR, &minLocR, &maxLocR);

    LaneBases bases;
    bases.left = maxLocL.x;
    bases.right = maxLocR.x + mid;
    return bases;
}
