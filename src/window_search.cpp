#include "window_search.hpp"
#include <opencv2/core.hpp>

ForegroundPixels extractFeatures(const cv::Mat& binary) {
    CV_Assert(binary.dims == 2 && binary.channels() == 1);

    // any non-zero value is foreground, whatever the depth
    cv::Mat mask = binary != 0;

    std::vector<cv::Point> nonzero;
    cv::findNonZero(mask, nonzero);

    ForegroundPixels features;
    features.xs.reserve(nonzero.size());
    features.ys.reserve(nonzero.size());
    for (const auto& p : nonzero) {
        features.xs.push_back(p.x);
        features.ys.push_back(p.y);
    }
    return features;
}

int pixelsInWindow(const SearchWindow& win,
                   const ForegroundPixels& features,
                   std::vector<int>& xs,
                   std::vector<int>& ys) {
    cv::Point tl = win.topLeft();
    cv::Point br = win.bottomRight();

    int found = 0;
    for (size_t i = 0; i < features.xs.size(); i++) {
        int x = features.xs[i];
        int y = features.ys[i];
        if (x >= tl.x && x <= br.x && y >= tl.y && y <= br.y) {
            xs.push_back(x);
            ys.push_back(y);
            found++;
        }
    }
    return found;
}

// mean x of the last `count` entries, truncated toward zero
static int meanOfTail(const std::vector<int>& xs, int count) {
    double sum = 0.0;
    for (size_t i = xs.size() - count; i < xs.size(); i++)
        sum += xs[i];
    return (int)(sum / count);
}

LanePixels findLanePixels(const cv::Mat& binary,
                          int nwindows, int margin, int minpix,
                          const WindowObserver& observer) {
    CV_Assert(binary.dims == 2 && binary.channels() == 1);
    CV_Assert(nwindows > 0);

    LanePixels out;
    out.bases = findLaneBases(binary);

    ForegroundPixels features = extractFeatures(binary);

    int window_height = binary.rows / nwindows;
    int leftx_current = out.bases.left;
    int rightx_current = out.bases.right;
    int y_current = binary.rows + window_height/2;

    for (int win = 0; win < nwindows; win++) {
        y_current -= window_height;

        SearchWindow leftWin{{leftx_current, y_current}, margin, window_height};
        SearchWindow rightWin{{rightx_current, y_current}, margin, window_height};

        if (observer) {
            observer(leftWin, LaneSide::Left);
            observer(rightWin, LaneSide::Right);
        }

        int left_count = pixelsInWindow(leftWin, features, out.leftx, out.lefty);
        int right_count = pixelsInWindow(rightWin, features, out.rightx, out.righty);

        // recenter if enough pixels found, otherwise carry x into the next band
        if (left_count > minpix)  leftx_current  = meanOfTail(out.leftx, left_count);
        if (right_count > minpix) rightx_current = meanOfTail(out.rightx, right_count);
    }

    return out;
}
