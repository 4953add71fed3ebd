#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace utils {

// sorted file list for a cv::glob pattern
std::vector<std::string> glob(const std::string& pattern);

void putTextInfo(cv::Mat& img,
                 const std::string& text,
                 int line,
                 double scale = 0.8);

// cv::imwrite that reports a missing encoder as false instead of throwing
bool writeImage(const std::string& path, const cv::Mat& img);

std::string describeFit(const cv::Vec3d& c);

}
