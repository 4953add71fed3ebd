#include "utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cstdio>
#include <iostream>

namespace utils {

std::vector<std::string> glob(const std::string& pattern) {
    std::vector<std::string> files;
    cv::glob(pattern, files, false);
    std::sort(files.begin(), files.end());
    return files;
}

void putTextInfo(cv::Mat& img,
                 const std::string& text,
                 int line,
                 double scale) {
    cv::Point org(20, 30 + line * (int)(30 * scale));
    cv::putText(img, text, org, cv::FONT_HERSHEY_SIMPLEX, scale,
                {255, 255, 255}, 1, cv::LINE_AA);
}

bool writeImage(const std::string& path, const cv::Mat& img) {
    try {
        return cv::imwrite(path, img);
    } catch (const cv::Exception& e) {
        std::cerr << "imwrite " << path << ": " << e.what() << "\n";
        return false;
    }
}

std::string describeFit(const cv::Vec3d& c) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "[%.6g, %.6g, %.6g]", c[0], c[1], c[2]);
    return buf;
}

}
