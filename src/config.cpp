#include "config.hpp"
#include <opencv2/core.hpp>

bool isValidConfig(const DetectorConfig& cfg) {
    return cfg.nwindows > 0 && cfg.margin > 0 && cfg.margin <= kMaxMargin &&
           cfg.minpix >= 0 && cfg.minfit >= 0;
}

static void readInt(const cv::FileStorage& fs, const char* key, int& value) {
    cv::FileNode node = fs[key];
    if (!node.empty()) node >> value;
}

bool loadDetectorConfig(const std::string& path, DetectorConfig& cfg) {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) return false;

    // missing keys keep the caller's values
    DetectorConfig loaded = cfg;
    readInt(fs, "nwindows", loaded.nwindows);
    readInt(fs, "margin", loaded.margin);
    readInt(fs, "minpix", loaded.minpix);
    readInt(fs, "minfit", loaded.minfit);

    if (!isValidConfig(loaded)) return false;

    cfg = loaded;
    return true;
}

bool saveDetectorConfig(const std::string& path, const DetectorConfig& cfg) {
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) return false;
    fs << "nwindows" << cfg.nwindows;
    fs << "margin" << cfg.margin;
    fs << "minpix" << cfg.minpix;
    fs << "minfit" << cfg.minfit;
    return true;
}
