#include <opencv2/opencv.hpp>
#include <iostream>
#include <string>
#include <filesystem>
#include <algorithm>
#include <vector>

#include "config.hpp"
#include "lane_detect.hpp"
#include "utils.hpp"

static void usage() {
    std::cout
        << "Usage:\n"
        << "  ./lane_lines --image <binary_image> [--out <file>] [--config <yml>] [--show]\n"
        << "  ./lane_lines --dir <binary_folder> [--out <dir>] [--config <yml>] [--show]\n"
        << "  ./lane_lines --write-config <yml>\n";
}

struct Options {
    std::string input;
    std::string out;
    std::string config;
    bool show = false;
};

static bool parseOptions(int argc, char** argv, Options& opt) {
    if (argc < 3) return false;
    opt.input = argv[2];

    for (int i = 3; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--show") {
            opt.show = true;
        } else if (arg == "--out" && i + 1 < argc) {
            opt.out = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            opt.config = argv[++i];
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

static void printFit(const std::string& name, const LaneResult& result,
                     const LaneDetector& detector) {
    bool left = name == "left";
    bool has = left ? detector.fit().hasLeft : detector.fit().hasRight;
    bool updated = left ? result.leftUpdated : result.rightUpdated;
    size_t count = left ? result.pixels.leftx.size() : result.pixels.rightx.size();

    std::cout << "  " << name << ": " << count << " px, ";
    if (!has) {
        std::cout << "no fit\n";
        return;
    }
    std::cout << utils::describeFit(left ? detector.fit().left : detector.fit().right)
              << (updated ? "" : " (previous)") << "\n";
}

// one detection pass; writes the overlay and the window debug image
static bool processImage(LaneDetector& detector,
                         const std::string& imgPath,
                         const std::string& overlayPath,
                         bool show) {
    cv::Mat binary = cv::imread(imgPath, cv::IMREAD_GRAYSCALE);
    if (binary.empty()) {
        std::cerr << "Could not read image: " << imgPath << "\n";
        return false;
    }

    // windows drawn over a 3-channel replica of the mask
    cv::Mat mask = binary != 0;
    cv::Mat windows;
    cv::cvtColor(mask, windows, cv::COLOR_GRAY2BGR);

    auto observer = [&](const SearchWindow& win, LaneSide) {
        drawSearchWindow(windows, win);
        if (show) {
            cv::imshow("sliding windows", windows);
            cv::waitKey(1);
        }
    };

    LaneResult result = detector.detect(binary, observer);

    std::cout << imgPath << "\n";
    printFit("left", result, detector);
    printFit("right", result, detector);

    utils::putTextInfo(windows, "left px: " + std::to_string(result.pixels.leftx.size()), 0);
    utils::putTextInfo(windows, "right px: " + std::to_string(result.pixels.rightx.size()), 1);

    std::filesystem::path outPath(overlayPath);
    if (outPath.has_parent_path())
        std::filesystem::create_directories(outPath.parent_path());

    std::filesystem::path windowsPath = outPath;
    windowsPath.replace_filename(outPath.stem().string() + "_windows" +
                                 outPath.extension().string());

    if (!utils::writeImage(overlayPath, result.overlay) ||
        !utils::writeImage(windowsPath.string(), windows)) {
        std::cerr << "Could not write output next to: " << overlayPath << "\n";
        return false;
    }

    if (show) {
        cv::imshow("lane lines", result.overlay);
        cv::waitKey(1);
    }
    return true;
}

static bool loadConfig(const Options& opt, DetectorConfig& cfg) {
    if (opt.config.empty()) return true;
    if (!loadDetectorConfig(opt.config, cfg)) {
        std::cerr << "Invalid or unreadable config: " << opt.config << "\n";
        return false;
    }
    std::cout << "Loaded config " << opt.config
              << " (nwindows=" << cfg.nwindows << ", margin=" << cfg.margin
              << ", minpix=" << cfg.minpix << ", minfit=" << cfg.minfit << ")\n";
    return true;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    std::string cmd = argv[1];

    // ------------------------------------------------------------
    // CONFIG MODE
    // ------------------------------------------------------------
    if (cmd == "--write-config") {
        if (argc < 3) {
            usage();
            return 1;
        }
        if (!saveDetectorConfig(argv[2], DetectorConfig())) {
            std::cerr << "Failed to save config file: " << argv[2] << "\n";
            return 1;
        }
        std::cout << "Saved default config: " << argv[2] << "\n";
        return 0;
    }

    Options opt;
    if ((cmd != "--image" && cmd != "--dir") || !parseOptions(argc, argv, opt)) {
        usage();
        return 1;
    }

    DetectorConfig cfg;
    if (!loadConfig(opt, cfg)) return 1;
    LaneDetector detector(cfg);

    // ------------------------------------------------------------
    // IMAGE MODE
    // ------------------------------------------------------------
    if (cmd == "--image") {
        std::string out = opt.out;
        if (out.empty()) {
            std::string base = std::filesystem::path(opt.input).stem().string();
            out = "output/" + base + "_lanes.png";
        }

        try {
            if (!processImage(detector, opt.input, out, opt.show)) return 1;
        } catch (const cv::Exception& e) {
            std::cerr << "Lane detection failed on " << opt.input << ": " << e.what() << "\n";
            return 1;
        }
        std::cout << "Saved: " << out << "\n";

        if (opt.show) cv::waitKey(0);
        return 0;
    }

    // ------------------------------------------------------------
    // DIRECTORY MODE (frames in order, fits carry over)
    // ------------------------------------------------------------
    std::vector<std::string> files = utils::glob(opt.input + "/*.png");
    std::vector<std::string> jpgs = utils::glob(opt.input + "/*.jpg");
    files.insert(files.end(), jpgs.begin(), jpgs.end());
    std::sort(files.begin(), files.end());

    if (files.empty()) {
        std::cerr << "No .png or .jpg images in: " << opt.input << "\n";
        return 1;
    }

    std::string outDir = opt.out.empty() ? "output/frames" : opt.out;
    int frameCount = 0;
    for (const auto& path : files) {
        std::string base = std::filesystem::path(path).stem().string();
        try {
            if (!processImage(detector, path, outDir + "/" + base + "_lanes.png", opt.show))
                return 1;
        } catch (const cv::Exception& e) {
            std::cerr << "Lane detection failed on " << path << ": " << e.what() << "\n";
            return 1;
        }
        frameCount++;
    }

    std::cout << "Processed " << frameCount << " frames into " << outDir << "\n";
    return 0;
}
