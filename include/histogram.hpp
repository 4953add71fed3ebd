#pragma once
#include <opencv2/core.hpp>

struct LaneBases {
    int left = 0;
    int right = 0;
};

// column sums over the bottom half of the image, 1 x cols CV_64F
cv::Mat bottomHalfHistogram(const cv::Mat& binary);

LaneBases findLaneBases(const cv::Mat& binary);
