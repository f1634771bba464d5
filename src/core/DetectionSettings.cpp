#include "formreg/DetectionSettings.hpp"
#include <opencv2/core.hpp>
#include <iostream>
#include <vector>

namespace formreg {

namespace {

bool openConfig(const std::string& path, cv::FileStorage& fs) {
    try {
        fs.open(path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        std::cerr << "Config could not be parsed: " << path << " (" << e.what() << ")\n";
        return false;
    }
    if (!fs.isOpened()) {
        std::cerr << "Cannot open config file: " << path << "\n";
        return false;
    }
    return true;
}

void readInt(const cv::FileNode& parent, const char* key, int lo, int hi, int& dst) {
    cv::FileNode n = parent[key];
    if (n.empty()) return;
    if (!n.isInt() && !n.isReal()) {
        std::cerr << "detection." << key << " is not a number, keeping " << dst << "\n";
        return;
    }
    const double v = static_cast<double>(n);
    if (!(v >= lo && v <= hi)) {
        std::cerr << "detection." << key << " = " << v << " out of range [" << lo << ", " << hi
                  << "], keeping " << dst << "\n";
        return;
    }
    dst = cvRound(v);
}

} // namespace

DetectionSettings loadDetectionSettings(const std::string& path) {
    DetectionSettings s;
    cv::FileStorage fs;
    if (!openConfig(path, fs)) {
        std::cerr << "Using default detection settings\n";
        return s;
    }

    cv::FileNode detection = fs["detection"];
    if (detection.empty()) {
        std::cerr << "No \"detection\" node in " << path << ", using defaults\n";
        return s;
    }
    readInt(detection, "min_size", 1, kMaxMinSize, s.minSize);
    readInt(detection, "threshold", 0, 255, s.threshold);
    readInt(detection, "padding", -kMaxPadding, kMaxPadding, s.padding);
    return s;
}

bool loadTemplateCorners(const std::string& path, CornerSet& out) {
    cv::FileStorage fs;
    if (!openConfig(path, fs)) return false;

    cv::FileNode corners = fs["template"]["corners"];
    if (corners.empty() || !corners.isSeq()) return false;

    std::vector<double> values;
    corners >> values;
    if (values.size() != 8) {
        std::cerr << "template.corners needs 8 numbers, got " << values.size() << "\n";
        return false;
    }
    for (int i = 0; i < 4; ++i) {
        out[i] = cv::Point2f(static_cast<float>(values[2 * i]), static_cast<float>(values[2 * i + 1]));
    }
    return true;
}

}
