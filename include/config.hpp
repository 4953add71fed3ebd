#pragma once
#include <string>

// keeps window edges well inside int range
constexpr int kMaxMargin = 1 << 20;

struct DetectorConfig {
    int nwindows = 12;   // bands per lane per pass
    int margin = 20;     // band half-width in px
    int minpix = 50;     // recenter when a band finds more than this
    int minfit = 1500;   // refit when a lane collects more than this
};

bool isValidConfig(const DetectorConfig& cfg);

bool loadDetectorConfig(const std::string& path, DetectorConfig& cfg);
bool saveDetectorConfig(const std::string& path, const DetectorConfig& cfg);
